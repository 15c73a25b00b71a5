#include "LogManager.hpp"
#include "Diagnostics.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace philoglot::utils
{

namespace
{

template<int InstanceId>
class ForwardingAppender : public plog::IAppender
{
public:
    static ForwardingAppender& Get()
    {
        static ForwardingAppender instance;
        return instance;
    }

    static void Detach() { Get().clear(); }

    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto* target : targets_)
            target->write(record);
    }

    void attach(plog::IAppender* target)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_.push_back(target);
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_.clear();
    }

private:
    std::mutex mutex_;
    std::vector<plog::IAppender*> targets_;
};

} // namespace

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::vector<void (*)()> LogManager::s_detachers;

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;

    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_settings.append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_settings.default_level);

        auto& forwarder = ForwardingAppender<InstanceId>::Get();
        if (auto logger = plog::get<InstanceId>())
            logger->setMaxSeverity(level);
        else
            plog::init<InstanceId>(level, &forwarder);

        forwarder.attach(file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            forwarder.attach(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_detachers.push_back(&ForwardingAppender<InstanceId>::Detach);
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<Diagnostics::kLogInstance>(const LoggerConfig&);

#if PHILOGLOT_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

void LogManager::Shutdown()
{
    for (auto detach : s_detachers)
        detach();
    s_detachers.clear();
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

std::optional<plog::Severity> LogManager::SeverityFromInt(long long level)
{
    if (level < plog::none || level > plog::verbose)
        return std::nullopt;
    return static_cast<plog::Severity>(level);
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_settings.log_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     s_settings.log_directory + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace philoglot::utils
