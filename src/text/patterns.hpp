#pragma once

#include <boost/regex.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace labelscan::text::detail {

/// Regular expressions shared by the classifier and the extractors, compiled once.
/// Input is ASCII-folded, so character classes stay in [A-Za-z].
struct Patterns {
  boost::regex keyword_phone;
  boost::regex international_phone;
  boost::regex international_compact;
  boost::regex national_phone;
  boost::regex phone_at_end;
  boost::regex leading_phone;

  boost::regex postal_token;
  std::vector<boost::regex> postal_city;  // tried in order
  boost::regex city_after_postal;
  boost::regex city_line;
  boost::regex name_like_line;

  boost::regex street_type_word;
  boost::regex street_number_first;   // "20 avenue ..."
  boost::regex street_type_first;     // "rue de la paix"
  boost::regex street_number_then_type;
  boost::regex street_type_anywhere;
  boost::regex number_then_text;
  boost::regex number_space_text;
  boost::regex street_inline;
  boost::regex number_before_postal;
  boost::regex postal_suffix;
  boost::regex trailing_street_number;
  boost::regex street_after_prefix;
  boost::regex phone_tail;
  boost::regex standalone_number;

  boost::regex legal_form_word;
  boost::regex business_word;
  boost::regex company_postal_split;
  boost::regex company_street_tail;

  boost::regex annex_with_value;
  boost::regex annex_word;

  boost::regex known_name_pair;
  boost::regex upper_name_before_number;
  boost::regex name_before_phone_keyword;
  boost::regex phone_keyword;
  boost::regex carrier_word;

  boost::regex ups_tracking;
  boost::regex postal_tracking;
  boost::regex digit_run;

  std::vector<boost::regex> city_trailing_garbage;
  boost::regex trailing_upper_token;
};

[[nodiscard]] const Patterns& patterns();

/// "a|b|c" with regex metacharacters escaped.
[[nodiscard]] std::string alternation(std::span<const std::string_view> words);

[[nodiscard]] std::string to_lower(std::string_view s);
[[nodiscard]] std::string trim_copy(std::string_view s);
[[nodiscard]] std::string collapse_spaces(std::string_view s);
[[nodiscard]] std::vector<std::string> split_words(std::string_view s);
[[nodiscard]] std::string digits_only(std::string_view s);

/// "dUPONT" -> "Dupont"; hyphen and apostrophe parts are capitalized separately.
[[nodiscard]] std::string capitalize_word(std::string_view word);

/// Title-cases text that has no lower-case letter; particles (de, la, sur, ...)
/// stay lower-case except at the start. Mixed-case text is returned unchanged.
[[nodiscard]] std::string display_case(std::string_view text);

/// Whole-word membership test on lower-case text.
[[nodiscard]] bool contains_word(std::string_view lower_text, std::string_view lower_word);
[[nodiscard]] bool contains_any_word(std::string_view lower_text,
                                     std::span<const std::string_view> lower_words);

/// Long digit runs with almost no letters, or a known carrier tracking format.
[[nodiscard]] bool looks_like_tracking_code(std::string_view text);

/// Department prefix 01-95 or overseas 971-976.
[[nodiscard]] bool is_valid_department(std::string_view postal_code);

/// Canonical +33XXXXXXXXX form of a French number, or nullopt when it is not one.
[[nodiscard]] std::optional<std::string> canonical_phone(std::string_view raw);

/// City text with country/cedex suffixes and stray characters removed; empty if too short.
[[nodiscard]] std::string clean_city(std::string_view raw);

}  // namespace labelscan::text::detail
