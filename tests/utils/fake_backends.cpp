#include "fake_backends.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <fstream>

#include <unistd.h>

namespace test_utils
{

FakeEmbeddingBackend::FakeEmbeddingBackend(std::string language, std::size_t length, std::string backend_name)
    : language_(std::move(language))
    , length_(length)
    , name_(std::move(backend_name))
{
}

void FakeEmbeddingBackend::set(const std::string& token, philoglot::embeddings::Vector values)
{
    vectors_[token] = std::move(values);
}

void FakeEmbeddingBackend::throwOn(const std::string& token)
{
    throwing_.push_back(token);
}

std::optional<philoglot::embeddings::Vector> FakeEmbeddingBackend::lookup(std::string_view token) const
{
    ++lookup_calls;
    if (std::find(throwing_.begin(), throwing_.end(), token) != throwing_.end())
    {
        throw philoglot::embeddings::BackendError("lookup failed for " + std::string(token));
    }
    auto it = vectors_.find(std::string(token));
    if (it == vectors_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

philoglot::embeddings::BackendFactory RecordingBackendFactory::make()
{
    return [this](philoglot::embeddings::EmbeddingVariant variant,
                  const std::string& language) -> std::unique_ptr<philoglot::embeddings::IEmbeddingBackend>
    {
        requests.push_back({ variant, language });
        auto backend = std::make_unique<FakeEmbeddingBackend>(
            language, length, std::string(philoglot::embeddings::variantName(variant)));
        for (const auto& [token, values] : vectors)
        {
            backend->set(token, values);
        }
        return backend;
    };
}

TempDir::TempDir()
{
    static std::atomic<int> counter{ 0 };
    path_ = std::filesystem::temp_directory_path() /
            ("philoglot-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir()
{
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDir::write(const std::string& relative, const std::string& content) const
{
    auto full = path_ / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary | std::ios::trunc);
    out << content;
    return full;
}

std::string word2vecBinary(const std::vector<std::pair<std::string, std::vector<float>>>& rows, std::size_t dims)
{
    std::string out = std::to_string(rows.size()) + " " + std::to_string(dims) + "\n";
    for (const auto& [token, values] : rows)
    {
        out += token;
        out += ' ';
        std::string raw(values.size() * sizeof(float), '\0');
        std::memcpy(raw.data(), values.data(), raw.size());
        out += raw;
        out += '\n';
    }
    return out;
}

} // namespace test_utils
