#include "patterns.hpp"

#include <labelscan/text/dictionaries.hpp>
#include <algorithm>
#include <cctype>

namespace labelscan::text::detail {

namespace {

constexpr auto kIcase = boost::regex::perl | boost::regex::icase;

bool is_particle(std::string_view lower) {
  static constexpr std::string_view kParticles[] = {
      "de", "du", "des", "la", "le", "les", "en", "sur", "sous", "et", "aux", "au", "d", "l",
  };
  return std::find(std::begin(kParticles), std::end(kParticles), lower) != std::end(kParticles);
}

std::string title_token(std::string_view token, bool first_token) {
  std::string out;
  out.reserve(token.size());
  std::size_t part_index = 0;
  std::size_t start = 0;
  while (start <= token.size()) {
    const std::size_t sep = token.find_first_of("-'", start);
    const std::size_t end = sep == std::string_view::npos ? token.size() : sep;
    const std::string lower = to_lower(token.substr(start, end - start));
    const bool keep_lower = !(first_token && part_index == 0) && is_particle(lower);
    if (keep_lower || lower.empty()) {
      out += lower;
    } else {
      out += capitalize_word(lower);
    }
    if (sep == std::string_view::npos) break;
    out += token[sep];
    start = sep + 1;
    ++part_index;
  }
  return out;
}

Patterns build_patterns() {
  const std::string types = alternation(street_types());
  const std::string annex = alternation(annex_keywords());
  const std::string phone_words = "telephone|tel|phone|portable|mobile|numero";
  const std::string phone_body = R"([1-9](?:[\s.\-/]?\d{2}){4})";

  Patterns p;
  p.keyword_phone = boost::regex(
      R"(\b(?:tel|telephone|contact|portable|mobile|phone)\b\s*[:.]?\s*((?:\+\s?33|0033|33)?\s*0?\s*)" +
          phone_body + R"()(?!\d))",
      kIcase);
  p.international_phone =
      boost::regex(R"((?<![\d+])(?:\+\s?33|0033)\s*0?\s*)" + phone_body + R"((?!\d))");
  p.international_compact = boost::regex(R"((?<![\d+])(?:\+33|0033)\s*\d{9,10}(?!\d))");
  p.national_phone = boost::regex(R"((?<![\d+])0\s*)" + phone_body + R"((?!\d))");
  p.phone_at_end = boost::regex(R"((?<![\d+])0\s*)" + phone_body + R"(\s*$)");
  p.leading_phone = boost::regex(R"(^(?:\+33|0033|0)\s*)" + phone_body + R"(\s*)");

  p.postal_token = boost::regex(R"((?<!\d)(\d{5})(?!\d))");
  p.postal_city = {
      boost::regex(R"((?<!\d)(\d{5})\s+([A-Za-z][A-Za-z\-\s']+))"),
      boost::regex(R"((?<!\d)(\d{5})\s*-\s*([A-Za-z][A-Za-z\-\s']+))"),
      boost::regex(R"(^(\d{5})\s+(.+)$)"),
      boost::regex(R"((?<!\d)(\d{5})\s+([A-Za-z][A-Za-z\-\s']{2,}))"),
  };
  p.city_after_postal = boost::regex(R"(^[\s\-]*([A-Za-z][A-Za-z\-\s']+))");
  p.city_line = boost::regex(R"(^[A-Z][a-z]+(?:-[A-Z]?[a-z]+)*$)");
  p.name_like_line = boost::regex(R"(^[A-Z][a-z]+\s+[A-Z][a-z]+$)");

  p.street_type_word = boost::regex(R"(\b(?:)" + types + R"()\b)", kIcase);
  p.street_number_first =
      boost::regex(R"(^\d{1,4}[\s,]*(?:bis|ter)?\s*(?:)" + types + R"()\b)", kIcase);
  p.street_type_first = boost::regex(R"(^(?:)" + types + R"()\s+)", kIcase);
  p.street_number_then_type =
      boost::regex(R"(\d{1,4}[\s,]+.*\b(?:)" + types + R"()\b)", kIcase);
  p.street_type_anywhere = boost::regex(R"(\b(?:)" + types + R"()\s+[A-Za-z])", kIcase);
  p.number_then_text = boost::regex(R"(^\d{1,4}[\s,]+[A-Za-z])");
  p.number_space_text = boost::regex(R"(^\d{1,4}\s+[A-Za-z])");
  p.street_inline = boost::regex(R"((\d{1,4})\s+()" + types +
                                     R"()\s+(DE\s+(?:LA\s+)?|DU\s+|DES\s+|D')?([A-Z][A-Za-z\s\-']{2,25}))",
                                 kIcase);
  p.number_before_postal = boost::regex(R"((?<!\d)(\d{1,4})\s+\d{5}(?!\d))");
  p.postal_suffix = boost::regex(R"(\s*(?<!\d)\d{5}(?!\d).*$)");
  p.trailing_street_number = boost::regex(
      R"(^(.*\b(?:)" + types + R"()\b.*?)[\s,]+(\d{1,4}(?:\s*(?:bis|ter))?)$)", kIcase);
  p.street_after_prefix = boost::regex(
      R"(^(.+?)\s+(\d{1,4}[\s,]*(?:bis|ter)?\s*(?:)" + types + R"()\b.*)$)", kIcase);
  p.phone_tail = boost::regex(R"(\s*\b(?:)" + phone_words + R"()\b[:\s.]*[\d\s.\-/+]*)", kIcase);
  p.standalone_number = boost::regex(R"(^\d{1,4}$)");

  p.legal_form_word =
      boost::regex(R"(\b(?:)" + alternation(company_legal_forms()) + R"()\b)", kIcase);
  p.business_word =
      boost::regex(R"(\b(?:)" + alternation(company_business_keywords()) + R"()\b)", kIcase);
  p.company_postal_split = boost::regex(R"(^(.+?)\s+(\d{5})\s+([A-Z][A-Za-z\-\s]+)$)");
  p.company_street_tail = boost::regex(
      R"(^(.+?)\s+\d+\s+(?:rue|avenue|boulevard|allee|chemin|place|impasse|passage)\b)", kIcase);

  p.annex_with_value =
      boost::regex(R"(\b()" + annex + R"()\b\s*[:.\-]?\s*([A-Za-z0-9\-]+))", kIcase);
  p.annex_word = boost::regex(R"(\b(?:)" + annex + R"()\b)", kIcase);

  p.known_name_pair = boost::regex(R"(\b([A-Z][A-Za-z]+)\s+([A-Z][A-Za-z]+)\b)");
  p.upper_name_before_number =
      boost::regex(R"(\b([A-Z]{2,}[A-Za-z]*)\s+([A-Z]{2,}[A-Za-z]*)\s+\d{1,4}\b)");
  p.name_before_phone_keyword = boost::regex(
      R"(\b([A-Z][a-z]+\s+[A-Z][A-Za-z]+)\s+(?i:)" + phone_words + R"()\b)");
  p.phone_keyword = boost::regex(R"(\b(?:)" + phone_words + R"(|contact)\b)", kIcase);
  p.carrier_word = boost::regex(R"(\b(?:)" + alternation(carrier_names()) + R"()\b)", kIcase);

  p.ups_tracking = boost::regex(R"(\b1Z[0-9A-Z]{16}\b)");
  p.postal_tracking = boost::regex(R"(\b[A-Z]{2}\d{9}[A-Z]{2}\b)");
  p.digit_run = boost::regex(R"(\d{2,})");

  p.city_trailing_garbage = {
      boost::regex(R"(\s+FRANCE\b.*$)", kIcase), boost::regex(R"(\s+FRA\b.*$)", kIcase),
      boost::regex(R"(\s+FR\b.*$)", kIcase),     boost::regex(R"(\s+CEDEX\b.*$)", kIcase),
      boost::regex(R"(\s+Contad\b.*$)", kIcase), boost::regex(R"(\s+TEL\b.*$)", kIcase),
      boost::regex(R"(\s+CONTACT.*$)", kIcase),  boost::regex(R"(\s+\d+\s*$)"),
  };
  p.trailing_upper_token = boost::regex(R"(\s+[A-Z]{2,}\s*$)");
  return p;
}

}  // namespace

const Patterns& patterns() {
  static const Patterns instance = build_patterns();
  return instance;
}

std::string alternation(std::span<const std::string_view> words) {
  static constexpr std::string_view kMeta = R"(.^$|()[]{}*+?\)";
  std::string out;
  for (const auto word : words) {
    if (!out.empty()) out += '|';
    for (const char c : word) {
      if (kMeta.find(c) != std::string_view::npos) out += '\\';
      out += c;
    }
  }
  return out;
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string trim_copy(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(start, end - start + 1));
}

std::string collapse_spaces(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (const char c : s) {
    if (c == ' ' || c == '\t') {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out += ' ';
    pending_space = false;
    out += c;
  }
  return out;
}

std::vector<std::string> split_words(std::string_view s) {
  std::vector<std::string> words;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    const std::size_t start = i;
    while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i > start) words.emplace_back(s.substr(start, i - start));
  }
  return words;
}

std::string digits_only(std::string_view s) {
  std::string out;
  for (const char c : s) {
    if (std::isdigit(static_cast<unsigned char>(c))) out += c;
  }
  return out;
}

std::string capitalize_word(std::string_view word) {
  std::string out = to_lower(word);
  if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  return out;
}

std::string display_case(std::string_view text) {
  const bool has_lower = std::any_of(text.begin(), text.end(), [](unsigned char c) {
    return std::islower(c) != 0;
  });
  if (has_lower) return std::string(text);

  std::string out;
  const auto words = split_words(text);
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0) out += ' ';
    out += title_token(words[i], i == 0);
  }
  return out;
}

bool contains_word(std::string_view lower_text, std::string_view lower_word) {
  if (lower_word.empty()) return false;
  std::size_t pos = lower_text.find(lower_word);
  while (pos != std::string_view::npos) {
    const bool left_ok = pos == 0 || !std::isalnum(static_cast<unsigned char>(lower_text[pos - 1]));
    const std::size_t end = pos + lower_word.size();
    const bool right_ok =
        end >= lower_text.size() || !std::isalnum(static_cast<unsigned char>(lower_text[end]));
    if (left_ok && right_ok) return true;
    pos = lower_text.find(lower_word, pos + 1);
  }
  return false;
}

bool contains_any_word(std::string_view lower_text,
                       std::span<const std::string_view> lower_words) {
  return std::any_of(lower_words.begin(), lower_words.end(),
                     [&](std::string_view w) { return contains_word(lower_text, w); });
}

bool looks_like_tracking_code(std::string_view text) {
  std::size_t digits = 0;
  std::size_t letters = 0;
  for (const char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isdigit(uc)) ++digits;
    else if (std::isalpha(uc)) ++letters;
  }
  if (digits >= 10 && letters <= 2) return true;
  const std::string s(text);
  const auto& p = patterns();
  return boost::regex_search(s, p.ups_tracking) || boost::regex_search(s, p.postal_tracking);
}

bool is_valid_department(std::string_view postal_code) {
  if (postal_code.size() != 5) return false;
  if (!std::all_of(postal_code.begin(), postal_code.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }
  const int dept = (postal_code[0] - '0') * 10 + (postal_code[1] - '0');
  if (dept >= 1 && dept <= 95) return true;
  if (dept == 97) {
    const int overseas = dept * 10 + (postal_code[2] - '0');
    return overseas >= 971 && overseas <= 976;
  }
  return false;
}

std::optional<std::string> canonical_phone(std::string_view raw) {
  std::string digits = digits_only(raw);
  const bool has_plus = raw.find('+') != std::string_view::npos;
  if (digits.starts_with("0033")) {
    digits.erase(0, 4);
  } else if (digits.starts_with("33") && (has_plus || digits.size() >= 11)) {
    digits.erase(0, 2);
  }
  // OCR often keeps the trunk zero after the country code.
  if (digits.size() == 10 && digits[0] == '0') digits.erase(0, 1);
  if (digits.size() != 9 || digits[0] == '0') return std::nullopt;
  return "+33" + digits;
}

std::string clean_city(std::string_view raw) {
  const auto& p = patterns();
  std::string city = trim_copy(raw);
  for (const auto& re : p.city_trailing_garbage) {
    city = boost::regex_replace(city, re, "");
  }
  const bool has_lower = std::any_of(city.begin(), city.end(), [](unsigned char c) {
    return std::islower(c) != 0;
  });
  if (has_lower) city = boost::regex_replace(city, p.trailing_upper_token, "");

  std::string kept;
  for (const char c : city) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc) || c == '-' || c == '\'' || c == ' ') {
      if (c == '-' && !kept.empty() && kept.back() == '-') continue;
      kept += c;
    }
  }
  kept = collapse_spaces(kept);
  const auto start = kept.find_first_not_of("- ");
  if (start == std::string::npos) return {};
  const auto end = kept.find_last_not_of("- ");
  kept = kept.substr(start, end - start + 1);
  return kept.size() >= 2 ? kept : std::string{};
}

}  // namespace labelscan::text::detail
