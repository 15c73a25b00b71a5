#pragma once

#include "EmbeddingVariant.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace philoglot::embeddings
{

using Vector = std::vector<float>;

// Failures inside a backend: unsupported language, missing or malformed model
// file. Processes never wrap these.
class BackendError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class IEmbeddingBackend
{
public:
    virtual ~IEmbeddingBackend() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual const std::string& language() const = 0;

    // std::nullopt when the token has no vector.
    [[nodiscard]] virtual std::optional<Vector> lookup(std::string_view token) const = 0;

    // Fixed for the lifetime of the backend.
    [[nodiscard]] virtual std::size_t vectorLength() const = 0;
};

// Constructs the backend family selected by variant, configured with language
// as its only parameter. Construction may load a large vector table.
std::unique_ptr<IEmbeddingBackend> createEmbeddingBackend(EmbeddingVariant variant, const std::string& language);

} // namespace philoglot::embeddings
