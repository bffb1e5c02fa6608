#pragma once

#include <cstddef>
#include <string_view>

namespace sift_core {

// --- Heuristic for conversion ---
inline constexpr float CHAR_PER_TOKEN_ESTIMATE = 3.5f;

size_t count_codepoints(std::string_view text);

// ceil(codepoints / 3.5), at least 1 for non-empty text.
size_t estimate_tokens(std::string_view text);

// Byte offset reached by moving `tokens` worth of codepoints forward from `from`, clamped to `limit`.
size_t advance_by_tokens(std::string_view text, size_t from, size_t tokens, size_t limit);

// Byte offset reached by moving `tokens` worth of codepoints back from `from`, clamped to `floor`.
size_t retreat_by_tokens(std::string_view text, size_t from, size_t tokens, size_t floor);

}  // namespace sift_core
