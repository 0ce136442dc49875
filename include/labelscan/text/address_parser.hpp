#pragma once

#include <labelscan/core/parsed_address.hpp>
#include <string_view>

namespace labelscan::text {

/// Turns one noisy OCR string into a scored, structured address.
///
/// Stateless: parse() depends only on its input and the static dictionaries, so
/// one instance may be shared across threads. Extractors are isolated from each
/// other; one that fails is logged and contributes no candidates.
class AddressParser {
 public:
  /// Never throws on content; empty or unusable input yields an empty record
  /// with confidence 0.
  [[nodiscard]] core::ParsedAddress parse(std::string_view raw_text) const;
};

/// True when both records have an address, the addresses overlap by at least
/// 85% of their characters, and their phone numbers agree when both exist.
[[nodiscard]] bool results_similar(const core::ParsedAddress& a, const core::ParsedAddress& b);

}  // namespace labelscan::text
