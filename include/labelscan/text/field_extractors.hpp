#pragma once

#include <labelscan/core/parsed_address.hpp>
#include <labelscan/text/line_classifier.hpp>
#include <labelscan/text/normalizer.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace labelscan::text {

/// Everything an extractor may look at for one parse call.
struct ExtractionInput {
  const NormalizedText& text;
  const std::vector<LineClassification>& classes;  // one per text.lines entry
};

using StringCandidates = std::vector<core::Candidate<std::string>>;
using PostalCityCandidates = std::vector<core::Candidate<core::PostalCity>>;
using NameCandidates = std::vector<core::Candidate<core::PersonName>>;

// Each extractor returns its candidates sorted by descending score, one entry per
// distinct value. Lines classified with high confidence as another field are
// skipped where that field would otherwise be misread.

/// Phone numbers in canonical +33 form; carrier tracking numbers are rejected.
[[nodiscard]] StringCandidates extract_phones(const ExtractionInput& in);

/// Postal code and city pairs; a bare postal code may carry an empty city, and a
/// city-only candidate (empty postal code) is produced when no code exists at all.
[[nodiscard]] PostalCityCandidates extract_postal_cities(const ExtractionInput& in);

[[nodiscard]] StringCandidates extract_streets(const ExtractionInput& in);

[[nodiscard]] NameCandidates extract_names(const ExtractionInput& in);

[[nodiscard]] StringCandidates extract_companies(const ExtractionInput& in);

/// Building/apartment/access details found in \p street or in lines not used by
/// the address itself, deduplicated and joined into a single candidate.
[[nodiscard]] StringCandidates extract_annexes(const ExtractionInput& in,
                                               std::string_view street);

/// A 1-4 digit line standing alone (a street number split from its street).
[[nodiscard]] std::string find_standalone_street_number(const ExtractionInput& in);

/// Street text cleanup: postal suffix, leading phone, phone keyword tail and any
/// letters-only prefix before "<number> <street type>" removed; a trailing
/// number moved to the front; upper-case text converted to display case.
[[nodiscard]] std::string clean_street(std::string_view raw);

}  // namespace labelscan::text
