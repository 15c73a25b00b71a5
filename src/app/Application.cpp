#include "Application.hpp"
#include "DocumentJson.hpp"
#include "../core/Document.hpp"
#include "../core/Errors.hpp"
#include "../embeddings/ModelPaths.hpp"
#include "../pipeline/PipelineFactory.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../utils/Profile.hpp"
#include "../wordnet/WordNetReader.hpp"

#include <plog/Log.h>

#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

namespace philoglot::app
{

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application()
{
    if (utils::LogManager::IsInitialized())
        utils::LogManager::Shutdown();
}

void Application::printUsage()
{
    std::cerr << "usage: philoglot --input <text file> [--config <config.toml>] [--output <json file>]\n"
                 "                 [--language <iso code>] [--variant fasttext|nlpl] [--help]\n";
}

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        auto next = [&](const char* flag) -> const char*
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "missing value for " << flag << "\n";
                return nullptr;
            }
            return argv_[++i];
        };

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            options_.show_help = true;
        }
        else if (std::strcmp(arg, "--config") == 0)
        {
            const char* v = next(arg);
            if (!v)
                return false;
            options_.config_path = v;
        }
        else if (std::strcmp(arg, "--input") == 0)
        {
            const char* v = next(arg);
            if (!v)
                return false;
            options_.input_path = v;
        }
        else if (std::strcmp(arg, "--output") == 0)
        {
            const char* v = next(arg);
            if (!v)
                return false;
            options_.output_path = v;
        }
        else if (std::strcmp(arg, "--language") == 0)
        {
            const char* v = next(arg);
            if (!v)
                return false;
            options_.language = v;
        }
        else if (std::strcmp(arg, "--variant") == 0)
        {
            const char* v = next(arg);
            if (!v)
                return false;
            options_.variant = v;
        }
        else
        {
            std::cerr << "unknown argument: " << arg << "\n";
            return false;
        }
    }

    if (!options_.show_help && options_.input_path.empty())
    {
        std::cerr << "--input is required\n";
        return false;
    }
    return true;
}

bool Application::initializeLogging(const config::LoggingConfig& logging)
{
    PROFILE_SCOPE_FUNCTION();

    utils::LogManager::Settings settings;
    settings.log_directory = logging.directory;
    settings.append_logs = logging.append;
    settings.default_level = utils::LogManager::SeverityFromInt(logging.level).value_or(plog::info);

    if (!utils::LogManager::Initialize(settings))
        return false;

    const std::string dir = logging.directory + "/";
    if (!utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                .filepath = dir + "run.log",
                                                .append_override = std::nullopt,
                                                .level_override = std::nullopt,
                                                .max_file_size = 10 * 1024 * 1024,
                                                .backup_count = 3,
                                                .add_console_appender = logging.console }))
        return false;

    utils::LogManager::RegisterLogger<utils::Diagnostics::kLogInstance>({ .name = "diagnostics",
                                                                          .filepath = dir + "pipeline.log",
                                                                          .append_override = std::nullopt,
                                                                          .level_override = plog::verbose,
                                                                          .max_file_size = 10 * 1024 * 1024,
                                                                          .backup_count = 3,
                                                                          .add_console_appender = false });

#if PHILOGLOT_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                                          .filepath = dir + "profiling.log",
                                                                          .append_override = std::nullopt,
                                                                          .level_override = plog::debug,
                                                                          .max_file_size = 10 * 1024 * 1024,
                                                                          .backup_count = 3,
                                                                          .add_console_appender = false });
#endif

    utils::Diagnostics::SetVerbose(logging.verbose_diagnostics);
    utils::Diagnostics::SetMaxPreview(static_cast<std::size_t>(logging.preview_bytes));
    return true;
}

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        printUsage();
        return kUsageError;
    }
    if (options_.show_help)
    {
        printUsage();
        return kOk;
    }

    config::ConfigLoader loader(options_.config_path);
    const bool config_ok = loader.load();
    config::AppConfig& cfg = loader.config();

    if (!initializeLogging(cfg.logging))
    {
        std::cerr << "failed to initialize logging in '" << cfg.logging.directory << "'\n";
        return kUsageError;
    }
    if (!config_ok)
    {
        PLOG_WARNING << "Continuing with default configuration: " << loader.lastError();
    }

    if (options_.language)
        cfg.pipeline.language = *options_.language;
    if (options_.variant)
        cfg.pipeline.embeddings_variant = *options_.variant;

    if (cfg.pipeline.language.empty())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "No pipeline language configured",
                                          "set [pipeline].language or pass --language");
        return kUsageError;
    }

    embeddings::ModelPaths::SetRoot(cfg.models.root);
    wordnet::WordNetCorpusReader::SetDataRoot(cfg.models.wordnet_root);

    std::unique_ptr<pipeline::Pipeline> pipe;
    try
    {
        pipe = pipeline::buildPipeline(cfg.pipeline);
    }
    catch (const core::ConfigurationError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid pipeline configuration",
                                          ex.what());
        return kUsageError;
    }

    std::ifstream in(options_.input_path, std::ios::binary);
    if (!in)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Cannot open input file",
                                          options_.input_path);
        return kUsageError;
    }
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    core::Doc doc = core::Doc::fromTokens(raw, core::split_on_spaces(raw), cfg.pipeline.language);
    PLOG_INFO << "Annotating " << options_.input_path << " (" << doc.words.size() << " tokens, language "
              << doc.language << ")";

    const pipeline::PipelineReport report = pipe->run(doc);

    const std::string rendered = toJson(doc).dump(2);
    if (options_.output_path)
    {
        std::ofstream out(*options_.output_path, std::ios::trunc);
        if (!out)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Cannot write output file",
                                              *options_.output_path);
            return kUsageError;
        }
        out << rendered << '\n';
    }
    else
    {
        std::cout << rendered << '\n';
    }

    if (const auto* failure = report.firstFailure())
    {
        PLOG_ERROR << "Stage '" << failure->stage_name << "' failed: " << failure->error.value_or("unknown error");
        return kStageFailed;
    }
    return kOk;
}

} // namespace philoglot::app
