#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace philoglot::wordnet
{

class IWordNetReader
{
public:
    virtual ~IWordNetReader() = default;

    // WordNet-side language code ("lat", "grk", "skt").
    [[nodiscard]] virtual const std::string& language() const = 0;
};

// Reader bound to one language's WordNet data under the configured root.
// Sense queries are not provided yet.
class WordNetCorpusReader final : public IWordNetReader
{
public:
    explicit WordNetCorpusReader(std::string language_code);
    WordNetCorpusReader(std::string language_code, std::filesystem::path data_root);

    [[nodiscard]] const std::string& language() const override { return language_; }
    [[nodiscard]] const std::filesystem::path& dataDirectory() const noexcept { return data_directory_; }

    static void SetDataRoot(std::filesystem::path root);
    [[nodiscard]] static std::filesystem::path DataRoot();

private:
    std::string language_;
    std::filesystem::path data_directory_;
};

// Maps a document language to its WordNet code: "lat" -> "lat", "grc" -> "grk",
// "san" -> "skt". Any other language has no WordNet.
[[nodiscard]] std::optional<std::string> wordnetCodeFor(std::string_view language);

} // namespace philoglot::wordnet
