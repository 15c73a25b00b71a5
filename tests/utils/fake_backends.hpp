#pragma once

#include "embeddings/IEmbeddingBackend.hpp"
#include "embeddings/EmbeddingsProcess.hpp"
#include "wordnet/WordNetProcess.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace test_utils
{

// In-memory backend: tokens not in the map are "not found", tokens in
// `throwing` make lookup() throw.
class FakeEmbeddingBackend : public philoglot::embeddings::IEmbeddingBackend
{
public:
    FakeEmbeddingBackend(std::string language, std::size_t length, std::string backend_name = "fake");

    void set(const std::string& token, philoglot::embeddings::Vector values);
    void throwOn(const std::string& token);

    std::string_view name() const override { return name_; }
    const std::string& language() const override { return language_; }
    std::optional<philoglot::embeddings::Vector> lookup(std::string_view token) const override;
    std::size_t vectorLength() const override
    {
        ++length_calls;
        return length_;
    }

    mutable std::size_t lookup_calls = 0;
    mutable std::size_t length_calls = 0;

private:
    std::string language_;
    std::size_t length_;
    std::string name_;
    std::unordered_map<std::string, philoglot::embeddings::Vector> vectors_;
    std::vector<std::string> throwing_;
};

// Records every construction request; builds a FakeEmbeddingBackend seeded
// with `vectors` for each one.
struct RecordingBackendFactory
{
    struct Request
    {
        philoglot::embeddings::EmbeddingVariant variant;
        std::string language;
    };

    std::size_t length = 2;
    std::unordered_map<std::string, philoglot::embeddings::Vector> vectors;
    std::vector<Request> requests;

    philoglot::embeddings::BackendFactory make();
};

struct FakeWordNetReader : public philoglot::wordnet::IWordNetReader
{
    explicit FakeWordNetReader(std::string code) : code_(std::move(code)) {}
    const std::string& language() const override { return code_; }

private:
    std::string code_;
};

// Scratch directory removed on destruction.
class TempDir
{
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path write(const std::string& relative, const std::string& content) const;

private:
    std::filesystem::path path_;
};

// word2vec binary encoding of the given rows, header included.
std::string word2vecBinary(const std::vector<std::pair<std::string, std::vector<float>>>& rows, std::size_t dims);

} // namespace test_utils
