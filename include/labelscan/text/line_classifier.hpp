#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace labelscan::text {

enum class LineType {
  Phone,
  Postal,
  Street,
  Name,
  Annex,
  Company,
  Unknown,
};

[[nodiscard]] std::string_view to_string(LineType type) noexcept;

/// Independent per-category scores of one line, each in [0,1].
struct CategoryScores {
  float phone{0.f};
  float postal{0.f};
  float street{0.f};
  float name{0.f};
  float annex{0.f};
  float company{0.f};
};

/// Best category of one tokenized line.
struct LineClassification {
  std::string content;
  LineType type{LineType::Unknown};
  float score{0.f};
  std::size_t original_index{0};
};

/// Lines whose best score stays below this are tagged Unknown.
inline constexpr float kMinClassificationScore = 0.25f;

[[nodiscard]] CategoryScores score_line(std::string_view line);

/// Highest-scoring category; ties go to the earlier of
/// phone, postal, street, name, annex, company.
[[nodiscard]] LineClassification classify_line(std::string_view line, std::size_t index);

[[nodiscard]] std::vector<LineClassification> classify_lines(
    const std::vector<std::string>& lines);

}  // namespace labelscan::text
