#include <labelscan/text/field_extractors.hpp>
#include <labelscan/core/logging.hpp>
#include <labelscan/text/dictionaries.hpp>
#include "patterns.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <set>
#include <type_traits>

namespace labelscan::text {

namespace {

using core::Candidate;
using core::CandidateSource;

bool is_strong(const ExtractionInput& in, std::size_t i, LineType type) {
  return i < in.classes.size() && in.classes[i].type == type && in.classes[i].score >= 0.5f;
}

template <typename T>
void add_candidate(std::vector<Candidate<T>>& out, T value, float score, CandidateSource source,
                   const std::function<std::string(const std::type_identity_t<T>&)>& key_of) {
  const std::string key = key_of(value);
  for (auto& c : out) {
    if (key_of(c.value) == key) {
      if (score > c.score) {
        c.score = score;
        c.source = source;
      }
      return;
    }
  }
  out.push_back(Candidate<T>{std::move(value), score, source});
}

template <typename T>
void sort_by_score(std::vector<Candidate<T>>& out) {
  std::stable_sort(out.begin(), out.end(),
                   [](const Candidate<T>& a, const Candidate<T>& b) { return a.score > b.score; });
}

std::string lower_key(const std::string& s) { return detail::to_lower(s); }

std::string to_upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

std::string name_case(std::string_view s) { return detail::display_case(to_upper(s)); }

bool has_digit(std::string_view s) {
  return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

/// Alphanumeric glued to either side of a match marks it as part of a code.
bool glued_to_code(const std::string& line, std::size_t pos, std::size_t len) {
  if (pos > 0 && std::isalpha(static_cast<unsigned char>(line[pos - 1]))) return true;
  const std::size_t end = pos + len;
  return end < line.size() && std::isalnum(static_cast<unsigned char>(line[end]));
}

std::string token_before(const std::string& line, std::size_t pos) {
  auto is_alnum = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };
  std::size_t end = pos;
  while (end > 0 && !is_alnum(line[end - 1])) --end;
  std::size_t start = end;
  while (start > 0 && is_alnum(line[start - 1])) --start;
  return line.substr(start, end - start);
}

std::string token_after(const std::string& line, std::size_t pos) {
  auto is_alnum = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };
  std::size_t start = pos;
  while (start < line.size() && !is_alnum(line[start])) ++start;
  std::size_t end = start;
  while (end < line.size() && is_alnum(line[end])) ++end;
  return line.substr(start, end - start);
}

/// A carrier name or tracking code right beside a match makes its digits a shipment reference.
bool next_to_carrier_or_code(const std::string& line, std::size_t pos, std::size_t len) {
  const auto& p = detail::patterns();
  for (const std::string& token : {token_before(line, pos), token_after(line, pos + len)}) {
    if (token.empty()) continue;
    if (boost::regex_search(token, p.carrier_word)) return true;
    const bool bare_phone = std::all_of(token.begin(), token.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; }) &&
                            detail::canonical_phone(token).has_value();
    if (!bare_phone && detail::looks_like_tracking_code(token)) return true;
  }
  return false;
}

/// First line carrying a postal code: with a city when possible, else a bare code.
int find_postal_line(const std::vector<std::string>& lines) {
  const auto& p = detail::patterns();
  for (std::size_t i = 0; i < lines.size(); ++i) {
    for (const auto& re : p.postal_city) {
      boost::smatch m;
      if (boost::regex_search(lines[i], m, re) && detail::is_valid_department(m[1].str()) &&
          !detail::clean_city(m[2].str()).empty()) {
        return static_cast<int>(i);
      }
    }
  }
  for (std::size_t i = 0; i < lines.size(); ++i) {
    for (boost::sregex_iterator it(lines[i].begin(), lines[i].end(), p.postal_token), end;
         it != end; ++it) {
      if (detail::is_valid_department((*it)[1].str())) return static_cast<int>(i);
    }
  }
  return -1;
}

bool is_city_line(const std::string& line) {
  const auto& p = detail::patterns();
  if (line.size() < 2 || line.size() > 25) return false;
  return boost::regex_match(line, p.city_line);
}

}  // namespace

StringCandidates extract_phones(const ExtractionInput& in) {
  const auto& p = detail::patterns();
  StringCandidates out;
  const std::function<std::string(const std::string&)> key = lower_key;

  for (const auto& line : in.text.lines) {
    boost::smatch m;
    if (boost::regex_search(line, m, p.keyword_phone)) {
      if (auto phone = detail::canonical_phone(m[1].str())) {
        core::logger()->debug("phone: keyword match {}", *phone);
        add_candidate(out, std::move(*phone), 0.95f, CandidateSource::Line, key);
      }
    }

    const std::pair<const boost::regex*, float> international[] = {
        {&p.international_phone, 0.9f},
        {&p.international_compact, 0.85f},
    };
    for (const auto& [re, score] : international) {
      for (boost::sregex_iterator it(line.begin(), line.end(), *re), end; it != end; ++it) {
        const auto pos = static_cast<std::size_t>(it->position());
        const auto len = static_cast<std::size_t>(it->length());
        if (glued_to_code(line, pos, len) || next_to_carrier_or_code(line, pos, len)) continue;
        if (auto phone = detail::canonical_phone(it->str())) {
          add_candidate(out, std::move(*phone), score, CandidateSource::Line, key);
        }
      }
    }

    const std::string lower = detail::to_lower(line);
    const bool keyword = detail::contains_any_word(lower, phone_keywords());
    const bool at_end = boost::regex_search(line, p.phone_at_end);
    const bool short_line = line.size() < 40;
    if (!keyword && !at_end && !short_line) continue;
    const float score = keyword ? 0.7f : (at_end ? 0.6f : 0.5f);
    for (boost::sregex_iterator it(line.begin(), line.end(), p.national_phone), end; it != end;
         ++it) {
      const auto pos = static_cast<std::size_t>(it->position());
      const auto len = static_cast<std::size_t>(it->length());
      if (glued_to_code(line, pos, len) || next_to_carrier_or_code(line, pos, len)) continue;
      if (auto phone = detail::canonical_phone(it->str())) {
        add_candidate(out, std::move(*phone), score, CandidateSource::Line, key);
      }
    }
  }
  sort_by_score(out);
  return out;
}

PostalCityCandidates extract_postal_cities(const ExtractionInput& in) {
  static constexpr float kPatternScores[] = {0.9f, 0.85f, 0.8f, 0.75f};
  const auto& p = detail::patterns();
  const auto& lines = in.text.lines;
  PostalCityCandidates out;
  const std::function<std::string(const core::PostalCity&)> key = [](const core::PostalCity& v) {
    return v.postal_code + "|" + detail::to_lower(v.city);
  };

  std::vector<std::size_t> unmatched;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto& line = lines[i];
    if (detail::looks_like_tracking_code(line)) continue;
    bool matched = false;
    for (std::size_t k = 0; k < p.postal_city.size() && !matched; ++k) {
      boost::smatch m;
      if (!boost::regex_search(line, m, p.postal_city[k])) continue;
      const std::string code = m[1].str();
      if (!detail::is_valid_department(code)) continue;
      const std::string city = detail::clean_city(m[2].str());
      if (city.empty()) continue;
      core::logger()->debug("postal: pattern {} matched {} {}", k, code, city);
      add_candidate(out, core::PostalCity{code, detail::display_case(city)}, kPatternScores[k],
                    CandidateSource::Line, key);
      matched = true;
    }
    if (!matched) unmatched.push_back(i);
  }

  // Run-on text: the postal code may sit mid-line after line breaks were lost.
  const std::string& flat = in.text.flat;
  for (boost::sregex_iterator it(flat.begin(), flat.end(), p.postal_city[0]), end; it != end;
       ++it) {
    const std::string code = (*it)[1].str();
    if (!detail::is_valid_department(code)) continue;
    const std::string city = detail::clean_city((*it)[2].str());
    if (city.empty()) continue;
    add_candidate(out, core::PostalCity{code, detail::display_case(city)},
                  kPatternScores[0] - 0.1f, CandidateSource::Global, key);
  }

  // Bare postal code: borrow the city from a neighbouring line.
  for (const std::size_t i : unmatched) {
    const auto& line = lines[i];
    if (detail::looks_like_tracking_code(line)) continue;
    for (boost::sregex_iterator it(line.begin(), line.end(), p.postal_token), end; it != end;
         ++it) {
      const std::string code = (*it)[1].str();
      if (!detail::is_valid_department(code)) continue;
      std::string city;
      if (i > 0 && is_city_line(lines[i - 1])) city = lines[i - 1];
      else if (i + 1 < lines.size() && is_city_line(lines[i + 1])) city = lines[i + 1];
      const float score = city.empty() ? 0.4f : 0.6f;
      add_candidate(out, core::PostalCity{code, city}, score, CandidateSource::Line, key);
      break;
    }
  }

  const bool any_postal = std::any_of(out.begin(), out.end(), [](const auto& c) {
    return !c.value.postal_code.empty();
  });
  if (!any_postal) {
    for (std::size_t i = 0; i < lines.size(); ++i) {
      const auto& line = lines[i];
      if (is_strong(in, i, LineType::Phone) || is_strong(in, i, LineType::Street)) continue;
      if (boost::regex_match(line, p.name_like_line)) continue;
      if (!is_city_line(line)) continue;
      if (detail::contains_any_word(detail::to_lower(line), city_exclusion_words())) continue;
      core::logger()->debug("postal: city without postal code {}", line);
      add_candidate(out, core::PostalCity{"", line}, 0.3f, CandidateSource::Line, key);
      break;
    }
  }
  sort_by_score(out);
  return out;
}

std::string clean_street(std::string_view raw) {
  const auto& p = detail::patterns();
  std::string s = detail::trim_copy(raw);

  const std::string without_postal = detail::trim_copy(boost::regex_replace(s, p.postal_suffix, ""));
  if (!without_postal.empty()) s = without_postal;
  s = boost::regex_replace(s, p.leading_phone, "");
  s = boost::regex_replace(s, p.phone_tail, " ");
  s = detail::collapse_spaces(detail::trim_copy(s));

  boost::smatch m;
  if (boost::regex_match(s, m, p.street_after_prefix) && !has_digit(m[1].str())) {
    s = m[2].str();
  }
  if (!s.empty() && !std::isdigit(static_cast<unsigned char>(s[0])) &&
      boost::regex_match(s, m, p.trailing_street_number)) {
    s = m[2].str() + " " + m[1].str();
  }

  const auto start = s.find_first_not_of(" ,;:-");
  if (start == std::string::npos) return {};
  const auto end = s.find_last_not_of(" ,;:-");
  s = detail::collapse_spaces(s.substr(start, end - start + 1));
  return detail::display_case(s);
}

StringCandidates extract_streets(const ExtractionInput& in) {
  const auto& p = detail::patterns();
  const auto& lines = in.text.lines;
  StringCandidates out;
  const std::function<std::string(const std::string&)> key = lower_key;

  auto add = [&](std::string_view raw, float score, CandidateSource source, std::string_view rule) {
    std::string street = clean_street(raw);
    if (street.empty() || detail::looks_like_tracking_code(street)) return;
    core::logger()->debug("street: {} -> {} ({})", rule, street, score);
    add_candidate(out, std::move(street), score, source, key);
  };

  const int postal_line = find_postal_line(lines);
  if (postal_line >= 0) {
    const auto& line = lines[static_cast<std::size_t>(postal_line)];
    boost::smatch m;
    if (boost::regex_search(line, m, p.postal_token) && m.position(1) > 0) {
      const std::string before =
          detail::trim_copy(line.substr(0, static_cast<std::size_t>(m.position(1))));
      if (before.size() >= 5 && boost::regex_search(before, p.street_type_word)) {
        add(before, 0.9f, CandidateSource::Line, "same line as postal code");
      }
    }
  }

  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (static_cast<int>(i) == postal_line) continue;
    const auto& line = lines[i];
    if (detail::looks_like_tracking_code(line)) continue;
    if (boost::regex_search(line, p.street_number_first)) {
      add(line, 0.95f, CandidateSource::Line, "number and type");
    } else if (boost::regex_search(line, p.street_type_first)) {
      add(line, 0.85f, CandidateSource::Line, "type first");
    } else if (boost::regex_search(line, p.street_number_then_type)) {
      add(line, 0.75f, CandidateSource::Line, "number then type");
    } else if (boost::regex_search(line, p.street_type_anywhere) && line.size() > 8) {
      add(line, 0.65f, CandidateSource::Line, "type anywhere");
    }
  }

  const std::string& flat = in.text.flat;
  for (boost::sregex_iterator it(flat.begin(), flat.end(), p.street_inline), end; it != end; ++it) {
    const auto& m = *it;
    std::string type = to_upper(m[2].str());
    if (type == "ATE" || type == "RTE") type = "ROUTE";
    static const boost::regex trailing_f(R"(\s+F\s*-?\s*$)");
    static const boost::regex trailing_postal(R"(\s+\d{5}.*$)");
    static const boost::regex trailing_code(R"(\s+[A-Z]{2,3}\s*$)");
    std::string name = detail::trim_copy(m[4].str());
    name = detail::trim_copy(boost::regex_replace(name, trailing_f, ""));
    name = detail::trim_copy(boost::regex_replace(name, trailing_postal, ""));
    name = detail::trim_copy(boost::regex_replace(name, trailing_code, ""));
    if (name.size() < 2) continue;
    // Match the type's case to the name so display_case sees one casing.
    const bool lower_name = std::any_of(name.begin(), name.end(),
                                        [](unsigned char c) { return std::islower(c) != 0; });
    if (lower_name) type = detail::to_lower(type);
    const std::string street = m[1].str() + " " + type + " " + m[3].str() + name;
    add(detail::collapse_spaces(street), 0.7f, CandidateSource::Global, "inline");
  }

  if (postal_line > 0) {
    const auto pl = static_cast<std::size_t>(postal_line);
    for (std::size_t i = pl >= 3 ? pl - 3 : 0; i < pl; ++i) {
      const auto& line = lines[i];
      if (line.size() > 8 && boost::regex_search(line, p.number_then_text) &&
          !detail::looks_like_tracking_code(line)) {
        add(line, 0.5f, CandidateSource::Line, "number near postal code");
      }
    }
  }

  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (static_cast<int>(i) == postal_line) continue;
    const auto& line = lines[i];
    if (line.size() > 10 && line.size() < 60 && boost::regex_search(line, p.number_space_text)) {
      add(line, 0.4f, CandidateSource::Line, "number then text");
    }
  }

  if (postal_line >= 0) {
    boost::smatch m;
    const auto& line = lines[static_cast<std::size_t>(postal_line)];
    if (boost::regex_search(line, m, p.number_before_postal)) {
      add(m[1].str(), 0.3f, CandidateSource::Line, "number before postal code");
    }
  }

  sort_by_score(out);
  return out;
}

NameCandidates extract_names(const ExtractionInput& in) {
  const auto& p = detail::patterns();
  const auto& lines = in.text.lines;
  NameCandidates out;
  const std::function<std::string(const core::PersonName&)> key = [](const core::PersonName& v) {
    return detail::to_lower(v.first_name + "|" + v.last_name);
  };

  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (is_strong(in, i, LineType::Phone) || is_strong(in, i, LineType::Postal) ||
        is_strong(in, i, LineType::Street)) {
      continue;
    }
    std::string line = lines[i];
    boost::smatch annex;
    if (boost::regex_search(line, annex, p.annex_word) && annex.position() > 0) {
      line = detail::trim_copy(line.substr(0, static_cast<std::size_t>(annex.position())));
    }
    if (boost::regex_search(line, p.digit_run)) continue;
    if (detail::contains_any_word(detail::to_lower(line), name_exclusion_words())) continue;
    if (line.size() > 40 || line.size() < 3) continue;

    auto raw_words = detail::split_words(line);
    bool civility = false;
    if (!raw_words.empty()) {
      std::string first = detail::to_lower(raw_words.front());
      if (!first.empty() && first.back() == '.') first.pop_back();
      const auto civ = civilities();
      if (std::find(civ.begin(), civ.end(), first) != civ.end()) {
        civility = true;
        raw_words.erase(raw_words.begin());
      }
    }
    std::vector<std::string> words;
    for (const auto& w : raw_words) {
      const bool alpha = std::all_of(w.begin(), w.end(), [](unsigned char c) {
        return std::isalpha(c) || c == '-' || c == '\'';
      });
      if (w.size() > 1 && alpha) words.push_back(w);
    }
    if (words.empty() || words.size() > 4) continue;

    int raw_score = words.size() >= 2 ? 2 : 1;
    core::PersonName name;
    std::size_t first_index = words.size();
    for (std::size_t j = 0; j < words.size(); ++j) {
      if (is_common_first_name(detail::to_lower(words[j]))) {
        name.first_name = name_case(words[j]);
        first_index = j;
        raw_score += 3;
        break;
      }
    }
    if (!name.first_name.empty() && words.size() > 1) {
      std::string last;
      for (std::size_t j = 0; j < words.size(); ++j) {
        if (j == first_index) continue;
        if (!last.empty()) last += ' ';
        last += words[j];
      }
      name.last_name = name_case(last);
      raw_score += 2;
    }
    if (name.last_name.empty()) {
      for (std::size_t j = 0; j < words.size(); ++j) {
        const auto& w = words[j];
        if (j != first_index && w.size() > 2 && to_upper(w) == w) {
          name.last_name = name_case(w);
          raw_score += 2;
          break;
        }
      }
    }
    if (name.first_name.empty() && name.last_name.empty()) {
      if (words.size() >= 2) {
        name.first_name = name_case(words[0]);
        std::string last;
        for (std::size_t j = 1; j < words.size(); ++j) {
          if (!last.empty()) last += ' ';
          last += words[j];
        }
        name.last_name = name_case(last);
        raw_score += 1;
      } else {
        name.last_name = name_case(words[0]);
      }
    }
    const float score =
        std::min(1.f, static_cast<float>(raw_score) / 8.f + (civility ? 0.1f : 0.f));
    add_candidate(out, std::move(name), score, CandidateSource::Line, key);
  }

  const auto excluded = [](const std::string& w) {
    const std::string lower = detail::to_lower(w);
    const auto list = inline_name_exclusions();
    return std::find(list.begin(), list.end(), lower) != list.end();
  };
  const std::string& flat = in.text.flat;
  for (boost::sregex_iterator it(flat.begin(), flat.end(), p.known_name_pair), end; it != end;
       ++it) {
    const std::string w1 = (*it)[1].str();
    const std::string w2 = (*it)[2].str();
    if (excluded(w1) || excluded(w2)) continue;
    if (!is_common_first_name(detail::to_lower(w1))) continue;
    add_candidate(out, core::PersonName{name_case(w1), name_case(w2)}, 0.6f,
                  CandidateSource::Global, key);
  }
  for (boost::sregex_iterator it(flat.begin(), flat.end(), p.upper_name_before_number), end;
       it != end; ++it) {
    const std::string w1 = (*it)[1].str();
    const std::string w2 = (*it)[2].str();
    if (excluded(w1) || excluded(w2) || w1.size() < 3 || w2.size() < 3) continue;
    add_candidate(out, core::PersonName{name_case(w1), name_case(w2)}, 0.45f,
                  CandidateSource::Global, key);
  }
  for (const auto& line : lines) {
    boost::smatch m;
    if (!boost::regex_search(line, m, p.name_before_phone_keyword)) continue;
    const auto words = detail::split_words(m[1].str());
    if (words.size() < 2 || excluded(words[0]) || excluded(words[1])) continue;
    add_candidate(out, core::PersonName{name_case(words[0]), name_case(words[1])}, 0.5f,
                  CandidateSource::Global, key);
  }

  sort_by_score(out);
  return out;
}

StringCandidates extract_companies(const ExtractionInput& in) {
  const auto& p = detail::patterns();
  const auto& lines = in.text.lines;
  StringCandidates out;
  const std::function<std::string(const std::string&)> key = lower_key;
  static const boost::regex leading_digits(R"(^[\d\s]+)");

  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (is_strong(in, i, LineType::Phone)) continue;
    const auto& line = lines[i];
    if (line.size() < 3) continue;
    const bool legal = boost::regex_search(line, p.legal_form_word);
    const bool business = boost::regex_search(line, p.business_word);
    if (!legal && !business) continue;

    std::string name = line;
    boost::smatch m;
    if (boost::regex_match(line, m, p.company_postal_split)) name = m[1].str();
    name = boost::regex_replace(name, leading_digits, "");
    if (boost::regex_search(name, m, p.company_street_tail)) name = m[1].str();
    name = detail::trim_copy(name);
    if (name.size() < 3) continue;
    if (boost::regex_search(name, p.street_type_first)) continue;
    if (detail::looks_like_tracking_code(name)) continue;
    core::logger()->debug("company: {} (legal form: {})", name, legal);
    add_candidate(out, std::move(name), legal ? 0.85f : 0.65f, CandidateSource::Line, key);
  }
  sort_by_score(out);
  return out;
}

StringCandidates extract_annexes(const ExtractionInput& in, std::string_view street) {
  const auto& p = detail::patterns();
  const auto& lines = in.text.lines;
  std::vector<std::string> parts;
  std::set<std::string> seen;
  auto push = [&](std::string part) {
    part = detail::trim_copy(part);
    if (part.empty()) return;
    if (seen.insert(detail::to_lower(part)).second) parts.push_back(std::move(part));
  };

  const auto street_kinds = street_types();
  if (!street.empty()) {
    const std::string s(street);
    for (boost::sregex_iterator it(s.begin(), s.end(), p.annex_with_value), end; it != end; ++it) {
      const std::string kw = detail::to_lower((*it)[1].str());
      // "Residence Les Pins" names the street itself.
      if (std::find(street_kinds.begin(), street_kinds.end(), kw) != street_kinds.end()) continue;
      push(it->str());
    }
  }

  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (is_strong(in, i, LineType::Street) || is_strong(in, i, LineType::Postal) ||
        is_strong(in, i, LineType::Phone)) {
      continue;
    }
    const auto& line = lines[i];
    if (!boost::regex_search(line, p.annex_word)) continue;
    bool any = false;
    for (boost::sregex_iterator it(line.begin(), line.end(), p.annex_with_value), end; it != end;
         ++it) {
      push(it->str());
      any = true;
    }
    if (!any && line.size() < 50) push(line);
  }

  StringCandidates out;
  if (parts.empty()) return out;
  std::string joined;
  for (const auto& part : parts) {
    if (!joined.empty()) joined += ", ";
    joined += part;
  }
  out.push_back(Candidate<std::string>{std::move(joined), 0.7f, CandidateSource::Line});
  return out;
}

std::string find_standalone_street_number(const ExtractionInput& in) {
  const auto& p = detail::patterns();
  for (const auto& line : in.text.lines) {
    if (boost::regex_match(line, p.standalone_number)) return line;
  }
  return {};
}

}  // namespace labelscan::text
