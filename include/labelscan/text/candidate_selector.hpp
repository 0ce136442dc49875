#pragma once

#include <labelscan/core/parsed_address.hpp>
#include <labelscan/text/field_extractors.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace labelscan::text {

/// Per-field candidate lists gathered for one parse call.
struct FieldCandidates {
  StringCandidates phones;
  PostalCityCandidates postal_cities;
  StringCandidates streets;
  NameCandidates names;
  StringCandidates companies;
  StringCandidates annexes;
  std::string standalone_street_number;
};

/// Scores of the selected candidates (0 when a field is empty).
struct SelectedScores {
  float street{0.f};
  float postal{0.f};
  float city{0.f};
  float phone{0.f};
  float first_name{0.f};
  float last_name{0.f};
  float company{0.f};
};

/// Weighted field scores plus structural bonuses, scaled down when no address
/// field resolved or when several postal codes compete. Clamped to [0,1].
[[nodiscard]] float compute_confidence(const SelectedScores& scores,
                                       std::size_t distinct_postal_codes) noexcept;

/// "<street>, <annex>, <postal> <city>" with empty parts omitted.
[[nodiscard]] std::string assemble_full_address(std::string_view street,
                                                std::string_view annex,
                                                std::string_view postal_code,
                                                std::string_view city);

/// Street with the annex fragments it contains removed. The original street is
/// kept when the removal would leave fewer than 3 characters.
[[nodiscard]] std::string remove_annex_from_street(std::string_view street,
                                                   std::string_view annex);

/// Highest-scoring non-empty candidate per field, merged into one record.
[[nodiscard]] core::ParsedAddress select_fields(const FieldCandidates& candidates,
                                                std::string_view raw_text);

}  // namespace labelscan::text
