#pragma once

#include <string>
#include <string_view>

namespace sift_core {

// Line-level structural markers shared by the heuristic classifier and the chunking strategies.
// Every function takes a single line, with or without its trailing newline.

bool is_blank_line(std::string_view line);

// ATX heading: up to three spaces, one to six '#', then whitespace or end of line.
bool is_markdown_heading(std::string_view line);
std::string markdown_heading_text(std::string_view line);

// Opening or closing ``` / ~~~ fence.
bool is_fence_line(std::string_view line);

bool is_markdown_list_item(std::string_view line);

// Line that starts a new log entry: leading timestamp or severity level.
bool is_log_entry_start(std::string_view line);

// Statement terminators, braces or declaration keywords.
bool is_code_line(std::string_view line);

// "key: value" / "key = value" with a short identifier-like key.
bool is_key_value_line(std::string_view line);

// Sentence-like line: several words and mostly letters.
bool is_prose_line(std::string_view line);

std::string_view trim_line_ending(std::string_view line);

}  // namespace sift_core
