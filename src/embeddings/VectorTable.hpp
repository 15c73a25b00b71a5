#pragma once

#include "IEmbeddingBackend.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace philoglot::embeddings
{

/**
 * @brief Read-only token -> vector table shared by the file-backed backends.
 *
 * Vectors are stored contiguously; keys are NFC-normalized on insert and on
 * lookup. Once loaded the table is never modified, so concurrent lookups are
 * safe.
 */
class VectorTable
{
public:
    VectorTable() = default;
    explicit VectorTable(std::size_t dimensions);

    // Text vector format used by fastText .vec and word2vec text dumps:
    //   <count> <dimensions>
    //   <token> <v1> ... <vN>
    // Throws BackendError on a missing file, a malformed or oversized header, a
    // row with the wrong number of values or fewer rows than the header
    // announced. Rows whose token is not valid UTF-8 are skipped with a warning.
    static VectorTable loadText(const std::filesystem::path& path);

    // word2vec binary format: text header "<count> <dimensions>\n", then per
    // entry the token, one space and <dimensions> little-endian float32 values.
    static VectorTable loadWord2VecBinary(const std::filesystem::path& path);

    // Returns false when the token is already present or the size is wrong.
    bool insert(std::string_view token, const Vector& values);

    [[nodiscard]] std::optional<Vector> lookup(std::string_view token) const;
    [[nodiscard]] bool contains(std::string_view token) const;

    [[nodiscard]] std::size_t dimensions() const noexcept { return dimensions_; }
    [[nodiscard]] std::size_t size() const noexcept { return index_.size(); }
    [[nodiscard]] bool empty() const noexcept { return index_.empty(); }

private:
    std::size_t dimensions_ = 0;
    std::vector<float> data_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace philoglot::embeddings
