#include "engine/language_codes.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 22> kLanguageNames = {{
    {"english", "en"},   {"spanish", "es"},    {"french", "fr"},     {"german", "de"},
    {"chinese", "zh"},   {"japanese", "ja"},   {"italian", "it"},    {"portuguese", "pt"},
    {"russian", "ru"},   {"korean", "ko"},     {"dutch", "nl"},      {"polish", "pl"},
    {"arabic", "ar"},    {"hindi", "hi"},      {"turkish", "tr"},    {"vietnamese", "vi"},
    {"thai", "th"},      {"indonesian", "id"}, {"swedish", "sv"},    {"danish", "da"},
    {"norwegian", "no"}, {"finnish", "fi"},
}};

} // namespace

std::string normalize_language(std::string_view language) {
    std::string lower(language);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = std::ranges::find(kLanguageNames, std::string_view(lower),
                                &std::pair<std::string_view, std::string_view>::first);
    if (it != kLanguageNames.end()) return std::string(it->second);
    return std::string(language);
}
