#include "sift_core/chunking/token_estimator.hpp"

#include <utf8.h>

#include <cmath>

namespace sift_core {

namespace {

size_t chars_for_tokens(size_t tokens) {
  return static_cast<size_t>(std::ceil(tokens * CHAR_PER_TOKEN_ESTIMATE));
}

}  // namespace

size_t count_codepoints(std::string_view text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

size_t estimate_tokens(std::string_view text) {
  if (text.empty()) {
    return 0;
  }
  const size_t codepoints = count_codepoints(text);
  const auto tokens = static_cast<size_t>(std::ceil(codepoints / CHAR_PER_TOKEN_ESTIMATE));
  return tokens == 0 ? 1 : tokens;
}

size_t advance_by_tokens(std::string_view text, size_t from, size_t tokens, size_t limit) {
  auto it = text.begin() + from;
  const auto end = text.begin() + limit;
  size_t remaining = chars_for_tokens(tokens);
  while (it != end && remaining > 0) {
    utf8::next(it, end);
    --remaining;
  }
  return static_cast<size_t>(it - text.begin());
}

size_t retreat_by_tokens(std::string_view text, size_t from, size_t tokens, size_t floor) {
  auto it = text.begin() + from;
  const auto begin = text.begin() + floor;
  size_t remaining = chars_for_tokens(tokens);
  while (it != begin && remaining > 0) {
    utf8::prior(it, begin);
    --remaining;
  }
  return static_cast<size_t>(it - text.begin());
}

}  // namespace sift_core
