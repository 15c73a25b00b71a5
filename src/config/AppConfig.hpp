#pragma once

#include <optional>
#include <string>
#include <vector>

#include <toml++/toml.h>

namespace philoglot::config
{

struct LoggingConfig
{
    int level = 4;                  // plog severity, 0 (none) .. 6 (verbose)
    bool append = true;
    bool verbose_diagnostics = false;
    bool console = true;
    std::string directory = "logs";
    int preview_bytes = 160;        // text shown per token or line in diagnostics traces
};

struct ModelsConfig
{
    std::string root = "models";
    std::string wordnet_root = "wordnet";
};

struct PipelineSettings
{
    std::string language;
    std::vector<std::string> stages = { "embeddings" };
    std::optional<std::string> embeddings_variant; // overrides the preset's variant
};

struct AppConfig
{
    LoggingConfig logging;
    ModelsConfig models;
    PipelineSettings pipeline;
};

/**
 * @brief Loads config.toml into AppConfig.
 *
 * A missing file yields the defaults. Parse errors are reported through
 * ErrorReporter and also leave the defaults in place; lastError() carries the
 * message. Unknown keys are ignored, wrongly typed values keep their default.
 */
class ConfigLoader
{
public:
    explicit ConfigLoader(std::string config_path = "config.toml");

    bool load();

    [[nodiscard]] const AppConfig& config() const noexcept { return config_; }
    [[nodiscard]] AppConfig& config() noexcept { return config_; }
    [[nodiscard]] const std::string& path() const noexcept { return config_path_; }
    [[nodiscard]] const char* lastError() const { return last_error_.c_str(); }

    // Applies the tables found in root on top of config.
    static void apply(const toml::table& root, AppConfig& config);

private:
    std::string config_path_;
    std::string last_error_;
    AppConfig config_;
};

} // namespace philoglot::config
