#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace philoglot::utils
{

class LogManager
{
public:
    struct Settings
    {
        std::string log_directory = "logs";
        bool append_logs = true;
        plog::Severity default_level = plog::info;
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const Settings& settings);

    // plog loggers live for the whole process, so each instance is wired to a
    // forwarding appender once; the file and console appenders behind it are
    // replaced on every Initialize/Shutdown cycle.
    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();

    // Maps the 0-6 integer used in config.toml onto plog's severities.
    static std::optional<plog::Severity> SeverityFromInt(long long level);

private:
    LogManager() = default;

    static bool PrepareLogDirectory();

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::vector<void (*)()> s_detachers;
};

} // namespace philoglot::utils
