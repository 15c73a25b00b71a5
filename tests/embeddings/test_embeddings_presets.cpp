#include <catch2/catch_test_macros.hpp>
#include "embeddings/EmbeddingsPresets.hpp"
#include "utils/fake_backends.hpp"

#include <set>

using namespace philoglot::embeddings;

TEST_CASE("Embeddings presets - table", "[embeddings][presets]")
{
    SECTION("Every preset has a distinct language code")
    {
        std::set<std::string_view> codes;
        for (const auto& preset : allPresets())
        {
            codes.insert(preset.language);
        }
        REQUIRE(codes.size() == allPresets().size());
    }

    SECTION("Aramaic does not reuse the Arabic code")
    {
        REQUIRE(presets::kArabic.language == "arb");
        REQUIRE(presets::kAramaic.language == "arc");
    }

    SECTION("Only Ancient Greek overrides the variant")
    {
        for (const auto& preset : allPresets())
        {
            if (preset.language == "grc")
            {
                REQUIRE(preset.variant == "nlpl");
            }
            else
            {
                REQUIRE(preset.variant == "fasttext");
            }
        }
    }

    SECTION("Descriptions")
    {
        REQUIRE(presets::kLatin.description == "Default embeddings for Latin.");
        REQUIRE(presets::kGreek.description == "Default embeddings for Ancient Greek.");
        REQUIRE(presets::kOldEnglish.description == "Default embeddings for Old English.");
    }
}

TEST_CASE("Embeddings presets - lookup", "[embeddings][presets]")
{
    SECTION("By language code")
    {
        auto sanskrit = findPreset("san");
        REQUIRE(sanskrit.has_value());
        REQUIRE(sanskrit->name == "sanskrit");
        REQUIRE_FALSE(findPreset("xyz").has_value());
    }

    SECTION("By name")
    {
        auto pali = findPresetByName("pali");
        REQUIRE(pali.has_value());
        REQUIRE(pali->language == "pli");
        REQUIRE_FALSE(findPresetByName("klingon").has_value());
    }
}

TEST_CASE("Embeddings presets - processes", "[embeddings][presets]")
{
    test_utils::RecordingBackendFactory factory;

    SECTION("Config carries the preset values")
    {
        auto cfg = makeConfig(presets::kGothic);
        REQUIRE(cfg.language == "got");
        REQUIRE(cfg.variant == "fasttext");
        REQUIRE(cfg.description == "Default embeddings for Gothic.");
    }

    SECTION("Greek preset resolves to the NLPL family")
    {
        auto process = createPresetProcess(presets::kGreek, nullptr, factory.make());
        REQUIRE(process->description() == "Default embeddings for Ancient Greek.");
        REQUIRE(process->algorithm().name() == "nlpl");
        REQUIRE(factory.requests.size() == 1);
        REQUIRE(factory.requests[0].language == "grc");
    }

    SECTION("Every preset runs over a document")
    {
        factory.vectors["verbum"] = { 0.25F, 0.75F };
        for (const auto& preset : allPresets())
        {
            auto doc = philoglot::core::Doc::fromTokens("verbum aliud", { "verbum", "aliud" });
            auto process = createPresetProcess(preset, &doc, factory.make());
            process->run();
            REQUIRE(doc.words[0].embedding == std::vector<float>{ 0.25F, 0.75F });
            REQUIRE(doc.words[1].embedding == std::vector<float>{ 0.0F, 0.0F });
        }
        REQUIRE(factory.requests.size() == allPresets().size());
    }
}
