#pragma once

#include <algorithm>
#include <array>
#include <string_view>

inline constexpr std::array<std::string_view, 8> SUPPORTED_LANGUAGES = {
    "zh", "en", "ja", "ko", "es", "fr", "de", "ru",
};

inline constexpr std::array<std::string_view, 9> SUPPORTED_MODELS = {
    "tiny", "base", "small", "medium", "large",
    "tiny.en", "base.en", "small.en", "medium.en",
};

inline bool is_supported_language(std::string_view code) {
    return std::ranges::find(SUPPORTED_LANGUAGES, code) != SUPPORTED_LANGUAGES.end();
}

inline bool is_supported_model(std::string_view model) {
    return std::ranges::find(SUPPORTED_MODELS, model) != SUPPORTED_MODELS.end();
}

// English-only whisper checkpoints carry a ".en" suffix.
inline bool is_english_only_model(std::string_view model) {
    return model.ends_with(".en");
}

// Human-readable name used in LLM prompts. Unknown codes pass through.
inline std::string_view language_name(std::string_view code) {
    if (code == "zh") return "Chinese";
    if (code == "en") return "English";
    if (code == "ja") return "Japanese";
    if (code == "ko") return "Korean";
    if (code == "es") return "Spanish";
    if (code == "fr") return "French";
    if (code == "de") return "German";
    if (code == "ru") return "Russian";
    return code;
}
