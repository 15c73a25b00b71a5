#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "embeddings/EmbeddingsPresets.hpp"
#include "embeddings/FastTextEmbeddings.hpp"
#include "embeddings/ModelPaths.hpp"
#include "embeddings/Word2VecEmbeddings.hpp"
#include "utils/fake_backends.hpp"

using namespace philoglot::embeddings;
using Catch::Matchers::ContainsSubstring;

namespace
{

// Points ModelPaths at a scratch directory for the lifetime of the fixture.
class ModelRoot
{
public:
    ModelRoot() : previous_(ModelPaths::Root()) { ModelPaths::SetRoot(dir_.path()); }
    ~ModelRoot() { ModelPaths::SetRoot(previous_); }

    const test_utils::TempDir& dir() const { return dir_; }

private:
    test_utils::TempDir dir_;
    std::filesystem::path previous_;
};

} // namespace

TEST_CASE("ModelPaths - language codes", "[embeddings][paths]")
{
    REQUIRE(ModelPaths::fastTextCode("lat") == "la");
    REQUIRE(ModelPaths::fastTextCode("arb") == "ar");
    REQUIRE(ModelPaths::fastTextCode("san") == "sa");
    REQUIRE(ModelPaths::fastTextCode("pli") == "pi");
    REQUIRE_FALSE(ModelPaths::fastTextCode("grc").has_value());

    REQUIRE(ModelPaths::nlplModelId("grc") == "30");
    REQUIRE(ModelPaths::nlplModelId("lat") == "56");
    REQUIRE_FALSE(ModelPaths::nlplModelId("got").has_value());

    SECTION("Every fastText preset language has a table")
    {
        for (const auto& preset : allPresets())
        {
            if (preset.variant == "fasttext")
            {
                REQUIRE(ModelPaths::fastTextCode(preset.language).has_value());
            }
            else
            {
                REQUIRE(ModelPaths::nlplModelId(preset.language).has_value());
            }
        }
    }
}

TEST_CASE("FastTextEmbeddings - loading", "[embeddings][fasttext]")
{
    ModelRoot root;

    SECTION("Reads the language's .vec file")
    {
        root.dir().write("lat/embeddings/fasttext/wiki.la.vec", "2 3\nrosa 1 2 3\naqua 4 5 6\n");
        FastTextEmbeddings backend("lat");
        REQUIRE(backend.name() == "fasttext");
        REQUIRE(backend.language() == "lat");
        REQUIRE(backend.vectorLength() == 3);
        REQUIRE(backend.vocabularySize() == 2);
        REQUIRE(backend.lookup("aqua") == std::vector<float>{ 4.0F, 5.0F, 6.0F });
        REQUIRE_FALSE(backend.lookup("ignis").has_value());
    }

    SECTION("Unsupported language")
    {
        REQUIRE_THROWS_WITH(FastTextEmbeddings("xyz"), ContainsSubstring("not available"));
    }

    SECTION("Missing model file")
    {
        REQUIRE_THROWS_AS(FastTextEmbeddings("got"), BackendError);
    }

    SECTION("Factory builds the fastText family")
    {
        root.dir().write("ang/embeddings/fasttext/wiki.ang.vec", "1 2\ncyning 1 1\n");
        auto backend = createEmbeddingBackend(EmbeddingVariant::FastText, "ang");
        REQUIRE(backend != nullptr);
        REQUIRE(backend->name() == "fasttext");
        REQUIRE(backend->vectorLength() == 2);
    }
}

TEST_CASE("Word2VecEmbeddings - loading", "[embeddings][nlpl]")
{
    ModelRoot root;

    SECTION("Prefers the binary model")
    {
        root.dir().write("grc/embeddings/nlpl/30/model.bin",
                         test_utils::word2vecBinary({ { "θεός", { 1.0F, -1.0F } } }, 2));
        root.dir().write("grc/embeddings/nlpl/30/model.txt", "1 2\nθεός 9 9\n");
        Word2VecEmbeddings backend("grc");
        REQUIRE(backend.name() == "nlpl");
        REQUIRE(backend.lookup("θεός") == std::vector<float>{ 1.0F, -1.0F });
    }

    SECTION("Falls back to the text model")
    {
        root.dir().write("lat/embeddings/nlpl/56/model.txt", "1 2\nlupus 0.5 0.5\n");
        Word2VecEmbeddings backend("lat");
        REQUIRE(backend.lookup("lupus") == std::vector<float>{ 0.5F, 0.5F });
    }

    SECTION("No model in the directory")
    {
        REQUIRE_THROWS_WITH(Word2VecEmbeddings("grc"), ContainsSubstring("no NLPL model"));
    }

    SECTION("Unsupported language")
    {
        REQUIRE_THROWS_AS(createEmbeddingBackend(EmbeddingVariant::Nlpl, "got"), BackendError);
    }
}
