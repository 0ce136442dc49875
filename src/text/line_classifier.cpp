#include <labelscan/text/line_classifier.hpp>
#include <labelscan/text/dictionaries.hpp>
#include <labelscan/text/similarity.hpp>
#include "patterns.hpp"

#include <algorithm>
#include <cctype>
#include <span>
#include <utility>

namespace labelscan::text {

namespace {

constexpr float kFuzzyThreshold = 0.8f;

float clamp01(float v) { return std::clamp(v, 0.f, 1.f); }

std::vector<std::string> lower_words(std::string_view line) {
  std::vector<std::string> words;
  for (auto& w : detail::split_words(detail::to_lower(line))) {
    // Strip surrounding punctuation so "rue," and "tel:" still match.
    const auto start = w.find_first_not_of(".,;:!?()\"");
    if (start == std::string::npos) continue;
    const auto end = w.find_last_not_of(".,;:!?()\"");
    words.push_back(w.substr(start, end - start + 1));
  }
  return words;
}

float best_word_match(const std::vector<std::string>& words,
                      std::span<const std::string_view> keywords) {
  float best = 0.f;
  for (const auto& w : words) {
    best = std::max(best, best_keyword_similarity(w, keywords));
    if (best >= 1.f) break;
  }
  return best;
}

float phone_score(std::string_view line, const std::string& s,
                  const std::vector<std::string>& words) {
  const auto& p = detail::patterns();
  float score = 0.f;
  const bool pattern = boost::regex_search(s, p.international_phone) ||
                       boost::regex_search(s, p.international_compact) ||
                       boost::regex_search(s, p.national_phone);
  if (pattern) score += 0.6f;
  if (best_word_match(words, phone_keywords()) >= 1.f) score += 0.3f;

  std::size_t digits = 0;
  std::size_t visible = 0;
  for (const char c : line) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    ++visible;
    if (std::isdigit(static_cast<unsigned char>(c))) ++digits;
  }
  if (pattern && visible > 0) {
    score += 0.1f * static_cast<float>(digits) / static_cast<float>(visible);
  }
  return clamp01(score);
}

float postal_score(const std::string& s) {
  const auto& p = detail::patterns();
  if (detail::looks_like_tracking_code(s)) return 0.f;
  float best = 0.f;
  for (boost::sregex_iterator it(s.begin(), s.end(), p.postal_token), end; it != end; ++it) {
    const std::string code = (*it)[1].str();
    if (!detail::is_valid_department(code)) continue;
    float score = 0.6f;
    const std::string rest = s.substr(static_cast<std::size_t>(it->position(1)) + 5);
    boost::smatch city;
    if (boost::regex_search(rest, city, p.city_after_postal) &&
        detail::clean_city(city[1].str()).size() >= 2) {
      score += 0.3f;
    }
    if (it->position(1) == 0) score += 0.1f;
    best = std::max(best, score);
  }
  return clamp01(best);
}

float street_score(const std::string& s, const std::vector<std::string>& words) {
  const auto& p = detail::patterns();
  if (detail::looks_like_tracking_code(s)) return 0.f;

  float score = 0.f;
  const float keyword = best_word_match(words, street_types());
  if (keyword >= 1.f) score = 0.6f;
  else if (keyword >= kFuzzyThreshold) score = 0.45f;
  if (score == 0.f) return 0.f;

  static const boost::regex number_start(R"(^\d{1,4}\b)");
  static const boost::regex number_end(R"(\b\d{1,4}$)");
  if (boost::regex_search(s, number_start) || boost::regex_search(s, number_end)) {
    score += 0.25f;
  }
  if (best_word_match(words, street_types_major()) >= 1.f) score += 0.1f;
  if (boost::regex_search(s, p.postal_token)) score -= 0.2f;
  return clamp01(score);
}

float name_score(const std::string& s, const std::vector<std::string>& words) {
  const auto& p = detail::patterns();
  if (boost::regex_search(s, p.digit_run)) return 0.f;
  if (words.empty() || words.size() > 5) return 0.f;

  std::size_t start = 0;
  float score = 0.2f;
  if (best_word_match({words.front()}, civilities()) >= 1.f) {
    score += 0.4f;
    start = 1;
  }
  std::size_t alpha_words = 0;
  bool dictionary_hit = false;
  for (std::size_t i = start; i < words.size(); ++i) {
    const auto& w = words[i];
    const bool alpha = std::all_of(w.begin(), w.end(), [](unsigned char c) {
      return std::isalpha(c) || c == '-' || c == '\'';
    });
    if (!alpha) return 0.f;
    ++alpha_words;
    if (is_common_first_name(w)) dictionary_hit = true;
  }
  if (alpha_words == 0 || alpha_words > 4) return 0.f;
  if (dictionary_hit) score += 0.4f;
  if (alpha_words >= 2 && alpha_words <= 3) score += 0.15f;

  const std::string lower = detail::to_lower(s);
  if (detail::contains_any_word(lower, name_exclusion_words())) score -= 0.5f;
  if (boost::regex_search(s, p.legal_form_word) || boost::regex_search(s, p.business_word)) {
    score -= 0.3f;
  }
  if (boost::regex_search(s, p.annex_word)) score -= 0.2f;
  return clamp01(score);
}

float annex_score(const std::string& s, const std::vector<std::string>& words) {
  const auto& p = detail::patterns();
  float score = 0.f;
  if (boost::regex_search(s, p.annex_word)) {
    score = 0.6f;
  } else if (best_word_match(words, annex_keywords()) >= kFuzzyThreshold) {
    score = 0.45f;
  }
  if (score == 0.f) return 0.f;
  if (boost::regex_search(s, p.annex_with_value)) score += 0.2f;
  if (s.size() < 50) score += 0.1f;
  return clamp01(score);
}

float company_score(const std::string& s, const std::vector<std::string>& words) {
  const auto& p = detail::patterns();
  const bool legal = boost::regex_search(s, p.legal_form_word);
  const bool business = boost::regex_search(s, p.business_word) ||
                        best_word_match(words, company_business_keywords()) >= 0.85f;
  if (legal && business) return 0.85f;
  if (legal) return 0.7f;
  if (business) return 0.5f;
  return 0.f;
}

}  // namespace

std::string_view to_string(LineType type) noexcept {
  switch (type) {
    case LineType::Phone: return "phone";
    case LineType::Postal: return "postal";
    case LineType::Street: return "street";
    case LineType::Name: return "name";
    case LineType::Annex: return "annex";
    case LineType::Company: return "company";
    default: return "unknown";
  }
}

CategoryScores score_line(std::string_view line) {
  const std::string s(line);
  const auto words = lower_words(line);
  CategoryScores scores;
  scores.phone = phone_score(line, s, words);
  scores.postal = postal_score(s);
  scores.street = street_score(s, words);
  scores.name = name_score(s, words);
  scores.annex = annex_score(s, words);
  scores.company = company_score(s, words);
  return scores;
}

LineClassification classify_line(std::string_view line, std::size_t index) {
  const CategoryScores scores = score_line(line);
  const std::pair<LineType, float> ordered[] = {
      {LineType::Phone, scores.phone},   {LineType::Postal, scores.postal},
      {LineType::Street, scores.street}, {LineType::Name, scores.name},
      {LineType::Annex, scores.annex},   {LineType::Company, scores.company},
  };
  LineClassification out;
  out.content = std::string(line);
  out.original_index = index;
  for (const auto& [type, score] : ordered) {
    if (score > out.score) {
      out.type = type;
      out.score = score;
    }
  }
  if (out.score < kMinClassificationScore) out.type = LineType::Unknown;
  return out;
}

std::vector<LineClassification> classify_lines(const std::vector<std::string>& lines) {
  std::vector<LineClassification> out;
  out.reserve(lines.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    out.push_back(classify_line(lines[i], i));
  }
  return out;
}

}  // namespace labelscan::text
