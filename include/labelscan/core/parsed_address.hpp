#pragma once

#include <string>

namespace labelscan::core {

/// Where a candidate was found: on a dedicated line or anywhere in the flattened text.
enum class CandidateSource {
  Line,
  Global,
};

/// Provisional, scored value for one structured field.
template <typename T>
struct Candidate {
  T value{};
  float score{0.f};
  CandidateSource source{CandidateSource::Line};
};

struct PostalCity {
  std::string postal_code;
  std::string city;
};

struct PersonName {
  std::string first_name;
  std::string last_name;
};

/// Structured address extracted from one OCR text. Empty string = not found.
struct ParsedAddress {
  std::string first_name;
  std::string last_name;
  std::string company_name;
  std::string street;
  std::string address_annex;
  std::string postal_code;
  std::string city;
  std::string phone_number;  // canonical +33XXXXXXXXX
  std::string full_address;
  float confidence{0.f};
  std::string raw_text;
  bool is_company{false};

  bool operator==(const ParsedAddress&) const = default;
};

/// True when the record can be geocoded: postal code and city, or an assembled
/// address of at least 8 characters.
[[nodiscard]] bool is_addressable(const ParsedAddress& address) noexcept;

}  // namespace labelscan::core
