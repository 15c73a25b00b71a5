#include "EmbeddingVariant.hpp"
#include "../core/Errors.hpp"

namespace philoglot::embeddings
{

EmbeddingVariant parseVariant(std::string_view name)
{
    if (name == "fasttext")
        return EmbeddingVariant::FastText;
    if (name == "nlpl")
        return EmbeddingVariant::Nlpl;
    throw core::ConfigurationError("embeddings variant", std::string(name), validVariantNames());
}

std::string_view variantName(EmbeddingVariant variant) noexcept
{
    switch (variant)
    {
    case EmbeddingVariant::FastText:
        return "fasttext";
    case EmbeddingVariant::Nlpl:
        return "nlpl";
    }
    return "unknown";
}

const std::vector<std::string>& validVariantNames()
{
    static const std::vector<std::string> names = { "fasttext", "nlpl" };
    return names;
}

} // namespace philoglot::embeddings
