#pragma once

#include "../config/AppConfig.hpp"

#include <optional>
#include <string>

namespace philoglot::app
{

// Command-line front end: annotate one text file and print it as JSON.
class Application
{
public:
    enum ExitCode
    {
        kOk = 0,
        kUsageError = 1,
        kStageFailed = 2
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    struct Options
    {
        std::string config_path = "config.toml";
        std::string input_path;
        std::optional<std::string> output_path;
        std::optional<std::string> language;
        std::optional<std::string> variant;
        bool show_help = false;
    };

    bool parseCommandLineArgs();
    bool initializeLogging(const config::LoggingConfig& logging);
    static void printUsage();

    int argc_;
    char** argv_;
    Options options_;
};

} // namespace philoglot::app
