#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace philoglot::embeddings
{

// Backend families. Adding one means extending parseVariant() and the
// exhaustive switch in createEmbeddingBackend().
enum class EmbeddingVariant
{
    FastText = 0,
    Nlpl = 1
};

inline constexpr std::string_view kDefaultVariantName = "fasttext";

// Throws core::ConfigurationError naming the valid options.
[[nodiscard]] EmbeddingVariant parseVariant(std::string_view name);

[[nodiscard]] std::string_view variantName(EmbeddingVariant variant) noexcept;

[[nodiscard]] const std::vector<std::string>& validVariantNames();

} // namespace philoglot::embeddings
