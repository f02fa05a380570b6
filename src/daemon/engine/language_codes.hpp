#pragma once

#include <string>
#include <string_view>

// Some servers report the language as a full English name ("english").
// Maps known names to ISO 639-1 codes; anything else is returned unchanged.
std::string normalize_language(std::string_view language);
