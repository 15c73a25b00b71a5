#include <catch2/catch_test_macros.hpp>
#include "core/Errors.hpp"
#include "embeddings/EmbeddingVariant.hpp"

using namespace philoglot::embeddings;

TEST_CASE("EmbeddingVariant - parsing", "[embeddings][variant]")
{
    SECTION("Known names")
    {
        REQUIRE(parseVariant("fasttext") == EmbeddingVariant::FastText);
        REQUIRE(parseVariant("nlpl") == EmbeddingVariant::Nlpl);
    }

    SECTION("Names are case sensitive")
    {
        REQUIRE_THROWS_AS(parseVariant("FastText"), philoglot::core::ConfigurationError);
    }

    SECTION("Unknown and empty names fail")
    {
        REQUIRE_THROWS_AS(parseVariant("word2vec"), philoglot::core::ConfigurationError);
        REQUIRE_THROWS_AS(parseVariant(""), philoglot::core::ConfigurationError);
    }

    SECTION("Message lists the options")
    {
        REQUIRE_THROWS_WITH(parseVariant("glove"),
                            "Invalid embeddings variant 'glove'. Available: 'fasttext', 'nlpl'.");
    }
}

TEST_CASE("EmbeddingVariant - names", "[embeddings][variant]")
{
    REQUIRE(variantName(EmbeddingVariant::FastText) == "fasttext");
    REQUIRE(variantName(EmbeddingVariant::Nlpl) == "nlpl");
    REQUIRE(kDefaultVariantName == "fasttext");

    for (const auto& name : validVariantNames())
    {
        REQUIRE(variantName(parseVariant(name)) == name);
    }
}
