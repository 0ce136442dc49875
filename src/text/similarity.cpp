#include <labelscan/text/similarity.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace labelscan::text {

std::size_t edit_distance(std::string_view a, std::string_view b) {
  if (a.empty()) return b.size();
  if (b.empty()) return a.size();
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> cur(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;
  for (std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

float edit_similarity(std::string_view a, std::string_view b) {
  const std::size_t longer = std::max(a.size(), b.size());
  if (longer == 0) return 1.f;
  return 1.f - static_cast<float>(edit_distance(a, b)) / static_cast<float>(longer);
}

float char_overlap(std::string_view a, std::string_view b) {
  if (a == b) return 1.f;
  if (a.empty() || b.empty()) return 0.f;
  const std::string_view longer = a.size() > b.size() ? a : b;
  const std::string_view shorter = a.size() > b.size() ? b : a;

  bool present[256] = {};
  for (const char c : longer) {
    present[static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)))] = true;
  }
  std::size_t matches = 0;
  for (const char c : shorter) {
    if (present[static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)))]) ++matches;
  }
  return static_cast<float>(matches) / static_cast<float>(longer.size());
}

float positional_similarity(std::string_view a, std::string_view b) {
  if (a.empty() || b.empty()) return 0.f;
  const std::string_view longer = a.size() > b.size() ? a : b;
  const std::string_view shorter = a.size() > b.size() ? b : a;
  std::size_t same = 0;
  for (std::size_t i = 0; i < shorter.size(); ++i) {
    if (shorter[i] == longer[i]) ++same;
  }
  return static_cast<float>(same) / static_cast<float>(longer.size());
}

float best_keyword_similarity(std::string_view word,
                              std::span<const std::string_view> keywords) {
  float best = 0.f;
  for (const auto kw : keywords) {
    if (word == kw) return 1.f;
    if (kw.size() <= 3 || word.size() <= 3) continue;
    // Length gap alone rules out a high score.
    const std::size_t gap = word.size() > kw.size() ? word.size() - kw.size()
                                                    : kw.size() - word.size();
    if (gap > 2) continue;
    best = std::max(best, edit_similarity(word, kw));
  }
  return best;
}

}  // namespace labelscan::text
