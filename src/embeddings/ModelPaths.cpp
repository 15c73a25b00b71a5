#include "ModelPaths.hpp"

#include <array>
#include <mutex>
#include <utility>

namespace philoglot::embeddings
{

namespace
{

struct CodeMapping
{
    std::string_view language;
    std::string_view code;
};

constexpr std::array<CodeMapping, 7> kFastTextCodes = { {
    { "ang", "ang" },
    { "arb", "ar" },
    { "arc", "arc" },
    { "got", "got" },
    { "lat", "la" },
    { "pli", "pi" },
    { "san", "sa" },
} };

constexpr std::array<CodeMapping, 2> kNlplModelIds = { {
    { "grc", "30" },
    { "lat", "56" },
} };

template<std::size_t N>
std::optional<std::string> findCode(const std::array<CodeMapping, N>& table, std::string_view language)
{
    for (const auto& entry : table)
    {
        if (entry.language == language)
            return std::string(entry.code);
    }
    return std::nullopt;
}

std::mutex g_root_mutex;
std::filesystem::path g_root = "models";

} // namespace

void ModelPaths::SetRoot(std::filesystem::path root)
{
    std::lock_guard<std::mutex> lock(g_root_mutex);
    g_root = std::move(root);
}

std::filesystem::path ModelPaths::Root()
{
    std::lock_guard<std::mutex> lock(g_root_mutex);
    return g_root;
}

std::optional<std::string> ModelPaths::fastTextCode(std::string_view language)
{
    return findCode(kFastTextCodes, language);
}

std::optional<std::string> ModelPaths::nlplModelId(std::string_view language)
{
    return findCode(kNlplModelIds, language);
}

std::filesystem::path ModelPaths::fastTextFile(std::string_view language, std::string_view code)
{
    return Root() / std::string(language) / "embeddings" / "fasttext" / ("wiki." + std::string(code) + ".vec");
}

std::filesystem::path ModelPaths::nlplDirectory(std::string_view language, std::string_view model_id)
{
    return Root() / std::string(language) / "embeddings" / "nlpl" / std::string(model_id);
}

} // namespace philoglot::embeddings
