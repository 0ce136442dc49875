#include <labelscan/vision/stability_detector.hpp>
#include <labelscan/core/logging.hpp>
#include <labelscan/text/dictionaries.hpp>
#include <labelscan/text/normalizer.hpp>
#include <labelscan/text/similarity.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace labelscan::vision {

namespace {

/// Lower-case ASCII with everything but letters and digits turned into single spaces.
std::vector<std::string> signature_tokens(std::string_view text) {
  const std::string folded = text::fold_to_ascii(text);
  std::vector<std::string> tokens;
  std::string current;
  for (const char c : folded) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      current += static_cast<char>(std::tolower(uc));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

std::string join(const std::vector<std::string>& parts, char sep) {
  std::string out;
  for (const auto& p : parts) {
    if (!out.empty()) out += sep;
    out += p;
  }
  return out;
}

bool all_alpha(const std::string& s) {
  return !s.empty() &&
         std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
}

bool all_digits(const std::string& s) {
  return !s.empty() &&
         std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

std::string_view to_string(ScanPhase phase) noexcept {
  switch (phase) {
    case ScanPhase::Locking: return "locking";
    case ScanPhase::Reading: return "reading";
    default: return "search";
  }
}

std::string compute_signature(std::string_view text) {
  const auto tokens = signature_tokens(text);
  if (tokens.empty()) return {};

  std::vector<std::string> numbers;
  for (const auto& t : tokens) {
    // Digit runs of 2+ inside mixed tokens count too ("1z99" -> "99").
    std::string run;
    for (std::size_t i = 0; i <= t.size(); ++i) {
      if (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) {
        run += t[i];
        continue;
      }
      if (run.size() >= 2) numbers.push_back(run);
      run.clear();
    }
  }
  std::sort(numbers.begin(), numbers.end());

  std::vector<std::string> keywords;
  for (const auto kw : text::stable_keywords()) {
    if (std::find(tokens.begin(), tokens.end(), kw) != tokens.end()) keywords.emplace_back(kw);
  }
  std::sort(keywords.begin(), keywords.end());

  std::vector<std::string> long_words;
  for (const auto& t : tokens) {
    if (t.size() >= 5 && all_alpha(t)) long_words.push_back(t);
    if (long_words.size() == 3) break;
  }
  std::sort(long_words.begin(), long_words.end());

  return join(numbers, '-') + "|" + join(keywords, '-') + "|" + join(long_words, '-');
}

bool looks_like_address(std::string_view text) {
  if (text.size() < 10) return false;
  const auto tokens = signature_tokens(text);
  const auto streets = text::street_types();
  for (const auto& t : tokens) {
    if (t.size() == 5 && all_digits(t)) return true;
    if (std::find(streets.begin(), streets.end(), t) != streets.end()) return true;
  }
  return false;
}

StabilityDetector::StabilityDetector(StabilityConfig config) : config_(config) {}

std::optional<core::Rect> StabilityDetector::visible_box(bool reading,
                                                         std::optional<core::Rect> text_box) {
  if (reading && text_box) {
    last_box_ = text_box;
    holdover_left_ = config_.box_holdover_frames;
    return text_box;
  }
  if (holdover_left_ > 0 && last_box_) {
    --holdover_left_;
    return last_box_;
  }
  last_box_.reset();
  return std::nullopt;
}

StabilityResult StabilityDetector::process(std::string_view filtered_text,
                                           std::optional<core::Rect> text_box) {
  StabilityResult result;

  if (filtered_text.size() < config_.min_text_length) {
    ++unstable_frames_;
    if (unstable_frames_ >= config_.unlock_frames) {
      core::logger()->debug("stability: {} frames without text, unlocking", unstable_frames_);
      reset();
    }
    result.phase = state_.phase;
    result.stable_count = state_.stable_count;
    result.locked_text = state_.locked_text;
    result.text_box = visible_box(false, std::nullopt);
    return result;
  }
  unstable_frames_ = 0;

  std::string signature = compute_signature(filtered_text);
  const bool same = !state_.last_signature.empty() &&
                    text::positional_similarity(signature, state_.last_signature) >
                        config_.similarity_threshold;
  state_.stable_count = same ? state_.stable_count + 1 : 1;
  state_.last_signature = signature;

  const ScanPhase previous = state_.phase;
  if (state_.stable_count >= config_.reading_frames) {
    state_.phase = ScanPhase::Reading;
    state_.locked_text = std::string(filtered_text);
  } else if (state_.stable_count >= config_.locking_frames) {
    state_.phase = ScanPhase::Locking;
  } else {
    state_.phase = ScanPhase::Search;
  }
  if (state_.phase != previous) {
    core::logger()->debug("stability: {} -> {} (count {})", to_string(previous),
                          to_string(state_.phase), state_.stable_count);
  }

  result.phase = state_.phase;
  result.stable_count = state_.stable_count;
  result.locked_text = state_.locked_text;
  result.text_box = visible_box(state_.phase == ScanPhase::Reading, text_box);
  result.address_like = looks_like_address(filtered_text);
  result.signature = std::move(signature);
  return result;
}

void StabilityDetector::reset() {
  state_ = StabilityState{};
  unstable_frames_ = 0;
  last_box_.reset();
  holdover_left_ = 0;
}

}  // namespace labelscan::vision
