#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace labelscan::text {

/// Levenshtein distance over bytes.
[[nodiscard]] std::size_t edit_distance(std::string_view a, std::string_view b);

/// 1 - distance / longer length; 1 for two empty strings.
[[nodiscard]] float edit_similarity(std::string_view a, std::string_view b);

/// Share of the shorter string's characters present anywhere in the longer one,
/// over the longer length (case-insensitive).
[[nodiscard]] float char_overlap(std::string_view a, std::string_view b);

/// Same-position character matches over the longer length; 0 if either is empty.
[[nodiscard]] float positional_similarity(std::string_view a, std::string_view b);

/// Best similarity of \p word against \p keywords.
/// Keywords of three letters or fewer only count on an exact match.
[[nodiscard]] float best_keyword_similarity(std::string_view word,
                                            std::span<const std::string_view> keywords);

}  // namespace labelscan::text
