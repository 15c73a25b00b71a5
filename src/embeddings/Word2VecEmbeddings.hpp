#pragma once

#include "IEmbeddingBackend.hpp"
#include "VectorTable.hpp"

#include <filesystem>

namespace philoglot::embeddings
{

// word2vec models from the NLPL vector repository.
class Word2VecEmbeddings final : public IEmbeddingBackend
{
public:
    // Loads <nlpl dir>/model.bin, or model.txt when no binary is present.
    explicit Word2VecEmbeddings(std::string language);

    // Loads from an explicit model file; ".bin" selects the binary reader.
    Word2VecEmbeddings(std::string language, const std::filesystem::path& model_file);

    [[nodiscard]] std::string_view name() const override { return "nlpl"; }
    [[nodiscard]] const std::string& language() const override { return language_; }
    [[nodiscard]] std::optional<Vector> lookup(std::string_view token) const override;
    [[nodiscard]] std::size_t vectorLength() const override { return table_.dimensions(); }

    [[nodiscard]] std::size_t vocabularySize() const noexcept { return table_.size(); }

private:
    std::string language_;
    VectorTable table_;
};

} // namespace philoglot::embeddings
