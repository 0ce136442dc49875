#include <labelscan/text/normalizer.hpp>
#include <labelscan/text/dictionaries.hpp>
#include "patterns.hpp"

#include <boost/regex.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace labelscan::text {

namespace {

std::string_view fold_code_point(std::uint32_t cp) {
  if (cp >= 0xC0 && cp <= 0xFF) {
    static constexpr std::string_view kLatin1[] = {
        "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",
        "D", "N", "O", "O", "O", "O", "O", "x", "O", "U", "U", "U", "U", "Y", "TH", "ss",
        "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
        "d", "n", "o", "o", "o", "o", "o", "", "o", "u", "u", "u", "u", "y", "th", "y",
    };
    return kLatin1[cp - 0xC0];
  }
  switch (cp) {
    case 0x00A0: case 0x202F: case 0x205F: case 0x3000: return " ";
    case 0x00B0: case 0x00BA: return "o";  // n°
    case 0x0152: return "OE";
    case 0x0153: return "oe";
    case 0x0178: return "Y";
    case 0x2018: case 0x2019: case 0x201B: case 0x02BC: return "'";
    case 0x201C: case 0x201D: case 0x00AB: case 0x00BB: return "\"";
    case 0x2026: return "...";
    default: break;
  }
  if (cp >= 0x2000 && cp <= 0x200A) return " ";
  if (cp >= 0x2010 && cp <= 0x2015) return "-";
  return {};  // combining marks, zero-width spaces and the rest
}

std::string apply_case_of(std::string_view original, std::string_view replacement) {
  const bool all_upper = std::all_of(original.begin(), original.end(), [](unsigned char c) {
    return !std::isalpha(c) || std::isupper(c);
  });
  std::string out(replacement);
  if (all_upper) {
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  } else if (!original.empty() && std::isupper(static_cast<unsigned char>(original[0]))) {
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  }
  return out;
}

}  // namespace

std::string fold_to_ascii(std::string_view utf8) {
  std::string out;
  out.reserve(utf8.size());
  std::size_t i = 0;
  while (i < utf8.size()) {
    const auto b0 = static_cast<unsigned char>(utf8[i]);
    if (b0 < 0x80) {
      out += static_cast<char>(b0);
      ++i;
      continue;
    }
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }
    else { ++i; continue; }
    if (i + len > utf8.size()) break;
    bool valid = true;
    for (std::size_t k = 1; k < len; ++k) {
      const auto bk = static_cast<unsigned char>(utf8[i + k]);
      if ((bk & 0xC0) != 0x80) { valid = false; break; }
      cp = (cp << 6) | (bk & 0x3F);
    }
    if (!valid) { ++i; continue; }
    out += fold_code_point(cp);
    i += len;
  }
  return out;
}

std::string correct_ocr_words(std::string_view line) {
  std::string out;
  out.reserve(line.size());
  std::size_t i = 0;
  while (i < line.size()) {
    if (!std::isalnum(static_cast<unsigned char>(line[i]))) {
      out += line[i++];
      continue;
    }
    const std::size_t start = i;
    while (i < line.size() && std::isalnum(static_cast<unsigned char>(line[i]))) ++i;
    const std::string_view word = line.substr(start, i - start);
    const std::string_view fixed = ocr_correction(detail::to_lower(word));
    out += fixed.empty() ? std::string(word) : apply_case_of(word, fixed);
  }
  return out;
}

NormalizedText normalize(std::string_view raw_text) {
  NormalizedText result;
  std::string text = fold_to_ascii(raw_text);

  std::string unified;
  unified.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      unified += '\n';
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
    } else {
      unified += text[i];
    }
  }

  static const boost::regex slash_triple(R"((\d{2})/(\d{2})/(\d{2})(?!\d))");
  // Longer chains ("06/12/34/56/78") need a second pass on the remainder.
  for (int pass = 0; pass < 4; ++pass) {
    std::string next = boost::regex_replace(unified, slash_triple, "$1 $2 $3");
    if (next == unified) break;
    unified = std::move(next);
  }

  if (unified.find('\n') == std::string::npos && unified.find(',') != std::string::npos) {
    static const boost::regex comma(R"(,\s*)");
    unified = boost::regex_replace(unified, comma, "\n");
  }

  std::size_t start = 0;
  while (start <= unified.size()) {
    const std::size_t end = std::min(unified.find('\n', start), unified.size());
    std::string line = detail::collapse_spaces(detail::trim_copy(
        std::string_view(unified).substr(start, end - start)));
    if (!line.empty()) result.lines.push_back(correct_ocr_words(line));
    start = end + 1;
  }

  for (const auto& line : result.lines) {
    if (!result.flat.empty()) result.flat += ' ';
    result.flat += line;
  }
  return result;
}

}  // namespace labelscan::text
