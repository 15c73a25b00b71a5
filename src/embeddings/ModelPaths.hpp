#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace philoglot::embeddings
{

// Locations of the on-disk vector tables. Models are never downloaded here;
// they are expected under the configured root:
//   <root>/<language>/embeddings/fasttext/wiki.<code>.vec
//   <root>/<language>/embeddings/nlpl/<model id>/model.bin  (or model.txt)
class ModelPaths
{
public:
    static void SetRoot(std::filesystem::path root);
    [[nodiscard]] static std::filesystem::path Root();

    // ISO 639-3 -> fastText Wikipedia code ("lat" -> "la").
    [[nodiscard]] static std::optional<std::string> fastTextCode(std::string_view language);

    // ISO 639-3 -> NLPL vector repository model id ("grc" -> "30").
    [[nodiscard]] static std::optional<std::string> nlplModelId(std::string_view language);

    [[nodiscard]] static std::filesystem::path fastTextFile(std::string_view language, std::string_view code);
    [[nodiscard]] static std::filesystem::path nlplDirectory(std::string_view language, std::string_view model_id);
};

} // namespace philoglot::embeddings
