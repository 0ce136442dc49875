#include <labelscan/text/candidate_selector.hpp>
#include "patterns.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace labelscan::text {

namespace {

constexpr float kWeightStreet = 0.25f;
constexpr float kWeightPostal = 0.20f;
constexpr float kWeightCity = 0.20f;
constexpr float kWeightPhone = 0.10f;
constexpr float kWeightFirstName = 0.10f;
constexpr float kWeightLastName = 0.10f;
constexpr float kWeightCompany = 0.05f;

/// A name found next to a company keeps its place only when a first-name dictionary backs it.
constexpr float kNameWithCompanyMinScore = 0.6f;

const core::Candidate<std::string>* best_string(const StringCandidates& list) {
  const core::Candidate<std::string>* best = nullptr;
  for (const auto& c : list) {
    if (c.value.empty()) continue;
    if (!best || c.score > best->score) best = &c;
  }
  return best;
}

}  // namespace

float compute_confidence(const SelectedScores& s, std::size_t distinct_postal_codes) noexcept {
  float confidence = kWeightStreet * s.street + kWeightPostal * s.postal + kWeightCity * s.city +
                     kWeightPhone * s.phone + kWeightFirstName * s.first_name +
                     kWeightLastName * s.last_name + kWeightCompany * s.company;
  const bool street = s.street > 0.f;
  const bool postal = s.postal > 0.f;
  const bool city = s.city > 0.f;
  if (postal && city) confidence += 0.1f;
  if (street && (postal || city)) confidence += 0.1f;
  if (!street && !postal && !city) confidence *= 0.5f;
  if (distinct_postal_codes >= 3) confidence *= 0.8f;
  else if (distinct_postal_codes == 2) confidence *= 0.9f;
  return std::clamp(confidence, 0.f, 1.f);
}

std::string assemble_full_address(std::string_view street, std::string_view annex,
                                  std::string_view postal_code, std::string_view city) {
  std::string locality(postal_code);
  if (!city.empty()) {
    if (!locality.empty()) locality += ' ';
    locality += city;
  }
  std::string out;
  for (const std::string_view part : {street, annex, std::string_view(locality)}) {
    if (part.empty()) continue;
    if (!out.empty()) out += ", ";
    out += part;
  }
  return out;
}

std::string remove_annex_from_street(std::string_view street, std::string_view annex) {
  std::string out(street);
  if (annex.empty() || street.empty()) return out;

  std::size_t start = 0;
  while (start <= annex.size()) {
    const std::size_t sep = annex.find(", ", start);
    const std::size_t end = sep == std::string_view::npos ? annex.size() : sep;
    const std::string part = detail::to_lower(annex.substr(start, end - start));
    if (!part.empty()) {
      const std::size_t pos = detail::to_lower(out).find(part);
      if (pos != std::string::npos) out.erase(pos, part.size());
    }
    if (sep == std::string_view::npos) break;
    start = sep + 2;
  }
  out = detail::collapse_spaces(out);
  const auto last = out.find_last_not_of(" ,;:-");
  out = last == std::string::npos ? std::string{} : out.substr(0, last + 1);
  return out.size() >= 3 ? out : std::string(street);
}

core::ParsedAddress select_fields(const FieldCandidates& c, std::string_view raw_text) {
  core::ParsedAddress out;
  out.raw_text = std::string(raw_text);
  SelectedScores scores;

  if (const auto* phone = best_string(c.phones)) {
    out.phone_number = phone->value;
    scores.phone = phone->score;
  }

  const core::Candidate<core::PostalCity>* postal = nullptr;
  for (const auto& pc : c.postal_cities) {
    if (pc.value.postal_code.empty()) continue;
    if (!postal || pc.score > postal->score) postal = &pc;
  }
  if (postal) {
    out.postal_code = postal->value.postal_code;
    scores.postal = postal->score;
    if (!postal->value.city.empty()) {
      out.city = postal->value.city;
      scores.city = postal->score;
    }
  }
  if (out.city.empty()) {
    // City recovered on its own line, without a postal code.
    const core::Candidate<core::PostalCity>* city_only = nullptr;
    for (const auto& pc : c.postal_cities) {
      if (!pc.value.postal_code.empty() || pc.value.city.empty()) continue;
      if (!city_only || pc.score > city_only->score) city_only = &pc;
    }
    if (city_only) {
      out.city = city_only->value.city;
      scores.city = city_only->score;
    }
  }
  std::set<std::string> postal_codes;
  for (const auto& pc : c.postal_cities) {
    if (!pc.value.postal_code.empty()) postal_codes.insert(pc.value.postal_code);
  }

  std::string street;
  if (const auto* best = best_string(c.streets)) {
    street = best->value;
    scores.street = best->score;
  }

  if (const auto* company = best_string(c.companies)) {
    out.company_name = company->value;
    out.is_company = true;
    scores.company = company->score;
  }

  const core::Candidate<core::PersonName>* name = nullptr;
  for (const auto& n : c.names) {
    if (n.value.first_name.empty() && n.value.last_name.empty()) continue;
    if (!name || n.score > name->score) name = &n;
  }
  if (name && (!out.is_company || name->score >= kNameWithCompanyMinScore)) {
    out.first_name = name->value.first_name;
    out.last_name = name->value.last_name;
    if (!out.first_name.empty()) scores.first_name = name->score;
    if (!out.last_name.empty()) scores.last_name = name->score;
  }

  if (const auto* annex = best_string(c.annexes)) out.address_annex = annex->value;

  street = remove_annex_from_street(street, out.address_annex);
  if (!c.standalone_street_number.empty() && !street.empty() &&
      !std::isdigit(static_cast<unsigned char>(street.front()))) {
    street = c.standalone_street_number + " " + street;
  }
  out.street = street;

  out.full_address =
      assemble_full_address(out.street, out.address_annex, out.postal_code, out.city);
  out.confidence = compute_confidence(scores, postal_codes.size());
  return out;
}

}  // namespace labelscan::text
