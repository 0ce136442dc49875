#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace labelscan::text {

/// Cleaned OCR text: ordered non-empty trimmed lines plus a single-line view.
struct NormalizedText {
  std::vector<std::string> lines;
  std::string flat;  // lines joined by one space
};

/// Fold UTF-8 to ASCII: Latin accents stripped, ligatures expanded, unicode
/// spaces, dashes and quotes mapped to their ASCII forms. Other code points and
/// malformed bytes are dropped.
[[nodiscard]] std::string fold_to_ascii(std::string_view utf8);

/// Rewrite known OCR misreadings word by word, keeping each word's casing style.
[[nodiscard]] std::string correct_ocr_words(std::string_view line);

/// Full normalization: ASCII folding, line-break unification, slash-separated
/// digit groups split ("06/12/34" -> "06 12 34"), comma split for single-line
/// input, whitespace collapsing and word correction. Never throws on content.
[[nodiscard]] NormalizedText normalize(std::string_view raw_text);

}  // namespace labelscan::text
