#include "AppConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <utility>

namespace philoglot::config
{

namespace
{

void applyLogging(const toml::table& section, LoggingConfig& logging)
{
    if (auto level = section["level"].value<int64_t>())
    {
        if (*level >= 0 && *level <= 6)
            logging.level = static_cast<int>(*level);
        else
            PLOG_WARNING << "config: logging.level " << *level << " out of range 0..6, keeping " << logging.level;
    }
    if (auto append = section["append"].value<bool>())
        logging.append = *append;
    if (auto verbose = section["verbose"].value<bool>())
        logging.verbose_diagnostics = *verbose;
    if (auto console = section["console"].value<bool>())
        logging.console = *console;
    if (auto directory = section["directory"].value<std::string>())
        logging.directory = *directory;
    if (auto preview = section["preview_bytes"].value<int64_t>())
    {
        if (*preview > 0 && *preview <= 1 << 20)
            logging.preview_bytes = static_cast<int>(*preview);
        else
            PLOG_WARNING << "config: logging.preview_bytes " << *preview << " out of range 1..1048576, keeping "
                         << logging.preview_bytes;
    }
}

void applyModels(const toml::table& section, ModelsConfig& models)
{
    if (auto root = section["root"].value<std::string>())
        models.root = *root;
    if (auto wordnet_root = section["wordnet_root"].value<std::string>())
        models.wordnet_root = *wordnet_root;
}

void applyPipeline(const toml::table& section, PipelineSettings& pipeline)
{
    if (auto language = section["language"].value<std::string>())
        pipeline.language = *language;

    if (auto stages = section["stages"].as_array())
    {
        std::vector<std::string> parsed;
        for (const auto& node : *stages)
        {
            if (auto name = node.value<std::string>())
                parsed.push_back(*name);
        }
        pipeline.stages = std::move(parsed);
    }

    if (auto variant = section["embeddings_variant"].value<std::string>())
        pipeline.embeddings_variant = *variant;
}

} // namespace

ConfigLoader::ConfigLoader(std::string config_path)
    : config_path_(std::move(config_path))
{
}

bool ConfigLoader::load()
{
    last_error_.clear();
    config_ = AppConfig{};

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        return true;
    }

    try
    {
        toml::table root = toml::parse(ifs, config_path_);
        apply(root, config_);
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());

        std::string error_details = std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + error_details;
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + config_path_);
        config_ = AppConfig{};
        return false;
    }
}

void ConfigLoader::apply(const toml::table& root, AppConfig& config)
{
    if (auto logging = root["logging"].as_table())
        applyLogging(*logging, config.logging);
    if (auto models = root["models"].as_table())
        applyModels(*models, config.models);
    if (auto pipeline = root["pipeline"].as_table())
        applyPipeline(*pipeline, config.pipeline);
}

} // namespace philoglot::config
