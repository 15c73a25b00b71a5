#pragma once

#include "IEmbeddingBackend.hpp"
#include "VectorTable.hpp"

#include <filesystem>

namespace philoglot::embeddings
{

// fastText Wikipedia vectors (.vec text format), one table per language.
class FastTextEmbeddings final : public IEmbeddingBackend
{
public:
    // Loads the table for language from ModelPaths; throws BackendError for an
    // unsupported language or an unreadable file.
    explicit FastTextEmbeddings(std::string language);

    // Loads from an explicit file, bypassing the language -> path mapping.
    FastTextEmbeddings(std::string language, const std::filesystem::path& vec_file);

    [[nodiscard]] std::string_view name() const override { return "fasttext"; }
    [[nodiscard]] const std::string& language() const override { return language_; }
    [[nodiscard]] std::optional<Vector> lookup(std::string_view token) const override;
    [[nodiscard]] std::size_t vectorLength() const override { return table_.dimensions(); }

    [[nodiscard]] std::size_t vocabularySize() const noexcept { return table_.size(); }

private:
    std::string language_;
    VectorTable table_;
};

} // namespace philoglot::embeddings
