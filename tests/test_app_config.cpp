#include <catch2/catch_test_macros.hpp>
#include "config/AppConfig.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/fake_backends.hpp"

#include <toml++/toml.h>

using namespace philoglot;

TEST_CASE("ConfigLoader - applying TOML tables", "[config]")
{
    config::AppConfig cfg;

    SECTION("Defaults")
    {
        REQUIRE(cfg.logging.level == 4);
        REQUIRE(cfg.logging.append);
        REQUIRE_FALSE(cfg.logging.verbose_diagnostics);
        REQUIRE(cfg.models.root == "models");
        REQUIRE(cfg.models.wordnet_root == "wordnet");
        REQUIRE(cfg.pipeline.stages == std::vector<std::string>{ "embeddings" });
        REQUIRE_FALSE(cfg.pipeline.embeddings_variant.has_value());
    }

    SECTION("All sections")
    {
        auto root = toml::parse(R"(
            [logging]
            level = 6
            append = false
            verbose = true
            console = false
            directory = "/tmp/philoglot-logs"
            preview_bytes = 40

            [models]
            root = "/srv/models"
            wordnet_root = "/srv/wordnet"

            [pipeline]
            language = "grc"
            stages = ["embeddings", "wordnet"]
            embeddings_variant = "fasttext"
        )");
        config::ConfigLoader::apply(root, cfg);

        REQUIRE(cfg.logging.level == 6);
        REQUIRE_FALSE(cfg.logging.append);
        REQUIRE(cfg.logging.verbose_diagnostics);
        REQUIRE_FALSE(cfg.logging.console);
        REQUIRE(cfg.logging.directory == "/tmp/philoglot-logs");
        REQUIRE(cfg.logging.preview_bytes == 40);
        REQUIRE(cfg.models.root == "/srv/models");
        REQUIRE(cfg.models.wordnet_root == "/srv/wordnet");
        REQUIRE(cfg.pipeline.language == "grc");
        REQUIRE(cfg.pipeline.stages == std::vector<std::string>{ "embeddings", "wordnet" });
        REQUIRE(cfg.pipeline.embeddings_variant == std::string("fasttext"));
    }

    SECTION("Wrong types and out-of-range values keep defaults")
    {
        auto root = toml::parse(R"(
            [logging]
            level = 9
            append = "yes"
            preview_bytes = 0

            [models]
            root = 12
        )");
        config::ConfigLoader::apply(root, cfg);

        REQUIRE(cfg.logging.level == 4);
        REQUIRE(cfg.logging.append);
        REQUIRE(cfg.logging.preview_bytes == 160);
        REQUIRE(cfg.models.root == "models");
    }

    SECTION("Non-string stage entries are skipped")
    {
        auto root = toml::parse(R"(
            [pipeline]
            stages = ["wordnet", 3, "embeddings"]
        )");
        config::ConfigLoader::apply(root, cfg);
        REQUIRE(cfg.pipeline.stages == std::vector<std::string>{ "wordnet", "embeddings" });
    }
}

TEST_CASE("ConfigLoader - loading files", "[config]")
{
    test_utils::TempDir dir;

    SECTION("Missing file yields defaults")
    {
        config::ConfigLoader loader((dir.path() / "absent.toml").string());
        REQUIRE(loader.load());
        REQUIRE(loader.config().models.root == "models");
    }

    SECTION("Valid file")
    {
        auto path = dir.write("config.toml", "[pipeline]\nlanguage = \"san\"\n");
        config::ConfigLoader loader(path.string());
        REQUIRE(loader.load());
        REQUIRE(loader.config().pipeline.language == "san");
        REQUIRE(std::string(loader.lastError()).empty());
    }

    SECTION("Parse error is reported and leaves defaults")
    {
        utils::ErrorReporter::ClearErrors();
        auto path = dir.write("broken.toml", "[pipeline]\nlanguage = \"lat\"\nstages = [\n");
        config::ConfigLoader loader(path.string());
        REQUIRE_FALSE(loader.load());
        REQUIRE(loader.config().pipeline.language.empty());
        REQUIRE_FALSE(std::string(loader.lastError()).empty());

        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].category == utils::ErrorCategory::Configuration);
        REQUIRE(errors[0].severity == utils::ErrorSeverity::Warning);
    }
}
