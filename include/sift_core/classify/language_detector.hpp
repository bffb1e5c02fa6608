#pragma once

#include <string>
#include <string_view>

namespace sift_core {

// Programming language from the origin's extension, or sniffed from the content.
// Returns an empty string when neither gives an answer.
std::string detect_programming_language(const std::string &origin, std::string_view content);

// Programming language for a known source extension ("cpp", "python", ...), empty otherwise.
std::string language_for_extension(const std::string &origin);

// "en", "ru" or "und", from the share of Latin and Cyrillic letters.
std::string detect_natural_language(std::string_view text);

}  // namespace sift_core
