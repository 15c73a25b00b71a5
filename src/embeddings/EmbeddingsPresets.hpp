#pragma once

#include "EmbeddingsProcess.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string_view>

namespace philoglot::embeddings
{

// Named, pre-filled embeddings configuration for one language.
struct EmbeddingsPreset
{
    std::string_view name;
    std::string_view language;
    std::string_view variant;
    std::string_view description;
};

namespace presets
{

inline constexpr EmbeddingsPreset kArabic{ "arabic", "arb", "fasttext", "Default embeddings for Arabic." };
inline constexpr EmbeddingsPreset kAramaic{ "aramaic", "arc", "fasttext", "Default embeddings for Aramaic." };
inline constexpr EmbeddingsPreset kGothic{ "gothic", "got", "fasttext", "Default embeddings for Gothic." };
inline constexpr EmbeddingsPreset kGreek{ "greek", "grc", "nlpl", "Default embeddings for Ancient Greek." };
inline constexpr EmbeddingsPreset kLatin{ "latin", "lat", "fasttext", "Default embeddings for Latin." };
inline constexpr EmbeddingsPreset kOldEnglish{ "old_english", "ang", "fasttext",
                                               "Default embeddings for Old English." };
inline constexpr EmbeddingsPreset kPali{ "pali", "pli", "fasttext", "Default embeddings for Pali." };
inline constexpr EmbeddingsPreset kSanskrit{ "sanskrit", "san", "fasttext", "Default embeddings for Sanskrit." };

} // namespace presets

[[nodiscard]] const std::array<EmbeddingsPreset, 8>& allPresets();

// Lookup by ISO 639-3 code ("lat") or by preset name ("latin").
[[nodiscard]] std::optional<EmbeddingsPreset> findPreset(std::string_view language);
[[nodiscard]] std::optional<EmbeddingsPreset> findPresetByName(std::string_view name);

[[nodiscard]] EmbeddingsConfig makeConfig(const EmbeddingsPreset& preset);

[[nodiscard]] std::unique_ptr<EmbeddingsProcess> createPresetProcess(const EmbeddingsPreset& preset,
                                                                     core::Doc* input_doc = nullptr,
                                                                     BackendFactory factory = {});

} // namespace philoglot::embeddings
