#include <labelscan/text/address_parser.hpp>
#include <labelscan/core/logging.hpp>
#include <labelscan/text/candidate_selector.hpp>
#include <labelscan/text/field_extractors.hpp>
#include <labelscan/text/line_classifier.hpp>
#include <labelscan/text/normalizer.hpp>
#include <labelscan/text/similarity.hpp>
#include "run_isolated.hpp"

namespace labelscan::text {

using detail::run_isolated;

core::ParsedAddress AddressParser::parse(std::string_view raw_text) const {
  core::ParsedAddress empty;
  empty.raw_text = std::string(raw_text);

  const NormalizedText text =
      run_isolated("normalization", [&] { return normalize(raw_text); });
  if (text.lines.empty()) return empty;

  const std::vector<LineClassification> classes =
      run_isolated("classification", [&] { return classify_lines(text.lines); });
  for (const auto& c : classes) {
    core::logger()->trace("line {} [{} {:.2f}] {}", c.original_index, to_string(c.type), c.score,
                          c.content);
  }

  const ExtractionInput in{text, classes};
  FieldCandidates candidates;
  candidates.phones = run_isolated("phone extraction", [&] { return extract_phones(in); });
  candidates.postal_cities =
      run_isolated("postal extraction", [&] { return extract_postal_cities(in); });
  candidates.streets = run_isolated("street extraction", [&] { return extract_streets(in); });
  candidates.names = run_isolated("name extraction", [&] { return extract_names(in); });
  candidates.companies =
      run_isolated("company extraction", [&] { return extract_companies(in); });

  std::string best_street;
  for (const auto& s : candidates.streets) {
    if (!s.value.empty()) {
      best_street = s.value;
      break;
    }
  }
  candidates.annexes =
      run_isolated("annex extraction", [&] { return extract_annexes(in, best_street); });
  candidates.standalone_street_number =
      run_isolated("street number lookup", [&] { return find_standalone_street_number(in); });

  core::ParsedAddress result = select_fields(candidates, raw_text);
  core::logger()->debug(
      "parsed: street='{}' postal='{}' city='{}' phone='{}' name='{} {}' company='{}' "
      "annex='{}' confidence={:.2f}",
      result.street, result.postal_code, result.city, result.phone_number, result.first_name,
      result.last_name, result.company_name, result.address_annex, result.confidence);
  return result;
}

bool results_similar(const core::ParsedAddress& a, const core::ParsedAddress& b) {
  if (a.full_address.empty() || b.full_address.empty()) return false;
  if (char_overlap(a.full_address, b.full_address) < 0.85f) return false;
  if (!a.phone_number.empty() && !b.phone_number.empty() && a.phone_number != b.phone_number) {
    return false;
  }
  return true;
}

}  // namespace labelscan::text
