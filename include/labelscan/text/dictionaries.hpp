#pragma once

#include <span>
#include <string_view>

namespace labelscan::text {

/// Static keyword tables. Entries are lower-case ASCII (input is folded before lookup).

/// Street-type keywords, including abbreviations and the "ate" misreading of "rte".
[[nodiscard]] std::span<const std::string_view> street_types() noexcept;

/// Street types that strongly indicate a street line on their own.
[[nodiscard]] std::span<const std::string_view> street_types_major() noexcept;

[[nodiscard]] std::span<const std::string_view> company_legal_forms() noexcept;

/// Business-type keywords (restaurant, pharmacie, ...), legal forms excluded.
[[nodiscard]] std::span<const std::string_view> company_business_keywords() noexcept;

/// Building/apartment/access keywords, longest spellings first.
[[nodiscard]] std::span<const std::string_view> annex_keywords() noexcept;

[[nodiscard]] std::span<const std::string_view> civilities() noexcept;

/// Words that disqualify a line from being a personal name.
[[nodiscard]] std::span<const std::string_view> name_exclusion_words() noexcept;

/// Upper-case tokens that are never part of a name found inside run-on text.
[[nodiscard]] std::span<const std::string_view> inline_name_exclusions() noexcept;

[[nodiscard]] std::span<const std::string_view> phone_keywords() noexcept;

/// Carrier names whose presence marks digit runs as tracking numbers.
[[nodiscard]] std::span<const std::string_view> carrier_names() noexcept;

/// Words that look like a capitalized city but are notes or phone labels.
[[nodiscard]] std::span<const std::string_view> city_exclusion_words() noexcept;

/// Logistics and address terms used in stability signatures.
[[nodiscard]] std::span<const std::string_view> stable_keywords() noexcept;

/// True when \p lower_word is a common French first name.
[[nodiscard]] bool is_common_first_name(std::string_view lower_word);

/// Known OCR misreading of \p lower_word, or an empty view when none.
[[nodiscard]] std::string_view ocr_correction(std::string_view lower_word);

}  // namespace labelscan::text
