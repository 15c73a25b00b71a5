#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace philoglot::utils
{

enum class ErrorCategory
{
    Initialization, // logging, startup
    Configuration,  // TOML parsing, invalid variant or language
    Backend,        // vector table or corpus reader loading
    Pipeline,       // a process stage failed
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but the run can continue
    Fatal    // Critical error, the run should stop
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Details for logs and bug reports
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Collects errors from the pipeline stages and the application layer and queues
 * them for the caller. Every report is also written to plog.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Backend, ErrorSeverity::Error,
 *                              "Failed to load vectors",
 *                              "models/lat/embeddings/fasttext/wiki.la.vec: not found");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       auto errors = ErrorReporter::GetPendingErrors();
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message Short message
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                              const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);

    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace philoglot::utils
