#include "EmbeddingsPresets.hpp"

#include <utility>

namespace philoglot::embeddings
{

const std::array<EmbeddingsPreset, 8>& allPresets()
{
    static constexpr std::array<EmbeddingsPreset, 8> kPresets = {
        presets::kArabic, presets::kAramaic, presets::kGothic, presets::kGreek,
        presets::kLatin,  presets::kOldEnglish, presets::kPali, presets::kSanskrit,
    };
    return kPresets;
}

std::optional<EmbeddingsPreset> findPreset(std::string_view language)
{
    for (const auto& preset : allPresets())
    {
        if (preset.language == language)
            return preset;
    }
    return std::nullopt;
}

std::optional<EmbeddingsPreset> findPresetByName(std::string_view name)
{
    for (const auto& preset : allPresets())
    {
        if (preset.name == name)
            return preset;
    }
    return std::nullopt;
}

EmbeddingsConfig makeConfig(const EmbeddingsPreset& preset)
{
    EmbeddingsConfig config;
    config.language = std::string(preset.language);
    config.variant = std::string(preset.variant);
    config.description = std::string(preset.description);
    return config;
}

std::unique_ptr<EmbeddingsProcess> createPresetProcess(const EmbeddingsPreset& preset, core::Doc* input_doc,
                                                       BackendFactory factory)
{
    return std::make_unique<EmbeddingsProcess>(makeConfig(preset), input_doc, std::move(factory));
}

} // namespace philoglot::embeddings
