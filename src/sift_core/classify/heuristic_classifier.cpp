#include "sift_core/classify/heuristic_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sift_core/classify/language_detector.hpp"
#include "sift_core/classify/line_markers.hpp"

namespace sift_core {

namespace {

constexpr double DOMINANT_LOG = 0.6;
constexpr double DOMINANT_TABLE = 0.8;
constexpr double MIN_SIGNAL = 0.3;
// A runner-up at least this fraction of the winner is a competing signal.
constexpr double COMPETING_RATIO = 0.5;
constexpr size_t MAX_SCORED_LINES = 200;

const std::unordered_map<std::string, DocumentClass> &extension_classes() {
  static const std::unordered_map<std::string, DocumentClass> map = {
      {".md", DocumentClass::Markdown},     {".markdown", DocumentClass::Markdown},
      {".json", DocumentClass::Config},     {".yaml", DocumentClass::Config},
      {".yml", DocumentClass::Config},      {".toml", DocumentClass::Config},
      {".ini", DocumentClass::Config},      {".cfg", DocumentClass::Config},
      {".conf", DocumentClass::Config},     {".env", DocumentClass::Config},
      {".properties", DocumentClass::Config}, {".csv", DocumentClass::Table},
      {".tsv", DocumentClass::Table},       {".log", DocumentClass::Log}};
  return map;
}

std::vector<std::string_view> non_blank_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t pos = 0;
  while (pos < text.size() && lines.size() < MAX_SCORED_LINES) {
    size_t nl = text.find('\n', pos);
    size_t end = nl == std::string_view::npos ? text.size() : nl;
    std::string_view line = trim_line_ending(text.substr(pos, end - pos));
    if (!is_blank_line(line)) {
      lines.push_back(line);
    }
    pos = end + 1;
  }
  return lines;
}

// Share of lines whose delimiter count equals the most common non-zero count, for the best
// delimiter. Prose lines never count as rows.
double delimiter_regularity(const std::vector<std::string_view> &lines) {
  if (lines.size() < 2) {
    return 0.0;
  }
  double best = 0.0;
  for (char delimiter : {',', '\t', '|', ';'}) {
    std::map<size_t, size_t> histogram;
    for (const auto &line : lines) {
      if (is_prose_line(line)) {
        continue;
      }
      size_t count = static_cast<size_t>(std::count(line.begin(), line.end(), delimiter));
      if (count > 0) {
        ++histogram[count];
      }
    }
    size_t mode_lines = 0;
    for (const auto &[count, n] : histogram) {
      mode_lines = std::max(mode_lines, n);
    }
    best = std::max(best, static_cast<double>(mode_lines) / static_cast<double>(lines.size()));
  }
  return best;
}

bool is_list_marker_only(std::string_view line) {
  std::string_view trimmed = line;
  while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.front()))) {
    trimmed.remove_prefix(1);
  }
  while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) {
    trimmed.remove_suffix(1);
  }
  return trimmed == "{" || trimmed == "}" || trimmed == "}," || trimmed == "[" ||
         trimmed == "]" || trimmed == "],";
}

std::vector<std::pair<DocumentClass, double>> ranked(const ClassScores &scores) {
  // Ties resolve in this order
  std::vector<std::pair<DocumentClass, double>> ranking = {
      {DocumentClass::Markdown, scores.markdown}, {DocumentClass::Code, scores.code},
      {DocumentClass::Log, scores.log},           {DocumentClass::Config, scores.config},
      {DocumentClass::Table, scores.table},       {DocumentClass::Text, scores.text}};
  std::stable_sort(ranking.begin(), ranking.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });
  return ranking;
}

}  // namespace

std::optional<DocumentClass> HeuristicClassifier::class_for_extension(const std::string &origin) {
  if (origin.empty()) {
    return std::nullopt;
  }
  std::string extension = std::filesystem::path(origin).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto it = extension_classes().find(extension);
  if (it != extension_classes().end()) {
    return it->second;
  }
  if (!language_for_extension(origin).empty()) {
    return DocumentClass::Code;
  }
  return std::nullopt;
}

ClassScores HeuristicClassifier::score(std::string_view sample) {
  ClassScores scores;
  const auto lines = non_blank_lines(sample);
  scores.lines = lines.size();
  if (lines.empty()) {
    return scores;
  }

  double markdown = 0, code = 0, config = 0, log = 0, text = 0;
  bool in_fence = false;
  for (const auto &line : lines) {
    if (is_fence_line(line)) {
      in_fence = !in_fence;
      markdown += 1;
      ++scores.markdown_structure;
      continue;
    }
    if (in_fence) {
      // Fenced lines belong to the markdown document around them
      markdown += 0.5;
      continue;
    }
    if (is_markdown_heading(line)) {
      markdown += 1;
      ++scores.markdown_structure;
    } else if (is_log_entry_start(line)) {
      log += 1;
    } else if (is_markdown_list_item(line)) {
      markdown += 0.5;
    } else if (is_list_marker_only(line)) {
      // Lone brackets are shared by JSON and brace languages
      continue;
    } else if (line.back() == ';') {
      code += 1;
    } else if (is_key_value_line(line)) {
      config += 1;
    } else if (is_code_line(line)) {
      code += 1;
    } else if (is_prose_line(line)) {
      text += 1;
    }
  }

  const auto total = static_cast<double>(lines.size());
  scores.markdown = markdown / total;
  scores.code = code / total;
  scores.config = config / total;
  scores.log = log / total;
  scores.text = text / total;
  scores.table = delimiter_regularity(lines);
  return scores;
}

DocumentClass HeuristicClassifier::classify(std::string_view sample,
                                            const std::string &origin) const {
  if (auto by_extension = class_for_extension(origin)) {
    return *by_extension;
  }

  const ClassScores scores = score(sample);
  if (scores.lines == 0) {
    return DocumentClass::Mixed;
  }
  if (scores.log >= DOMINANT_LOG) {
    return DocumentClass::Log;
  }
  if (scores.lines >= 2 && scores.table >= DOMINANT_TABLE && scores.text < MIN_SIGNAL) {
    return DocumentClass::Table;
  }
  // Headed prose is markdown even when most lines are plain sentences
  if (scores.markdown_structure > 0 && scores.markdown + scores.text >= 0.6 &&
      scores.code < MIN_SIGNAL) {
    return DocumentClass::Markdown;
  }

  auto ranking = ranked(scores);
  const auto &[best_class, best] = ranking[0];
  const double runner_up = ranking[1].second;
  if (best < MIN_SIGNAL) {
    return DocumentClass::Mixed;
  }
  if (runner_up >= MIN_SIGNAL && runner_up >= best * COMPETING_RATIO) {
    return DocumentClass::Mixed;
  }
  return best_class;
}

DocumentClass HeuristicClassifier::classify_block(std::string_view block) {
  const auto lines = non_blank_lines(block);
  if (lines.empty()) {
    return DocumentClass::Text;
  }
  if (is_fence_line(lines.front()) || is_markdown_heading(lines.front())) {
    return DocumentClass::Markdown;
  }

  const ClassScores scores = score(block);
  if (scores.log >= 0.5) {
    return DocumentClass::Log;
  }
  if (lines.size() >= 2 && scores.table >= DOMINANT_TABLE && scores.text == 0.0) {
    return DocumentClass::Table;
  }
  auto ranking = ranked(scores);
  if (ranking[0].second == 0.0) {
    return DocumentClass::Text;
  }
  return ranking[0].first;
}

}  // namespace sift_core
