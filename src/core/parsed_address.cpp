#include <labelscan/core/parsed_address.hpp>

namespace labelscan::core {

bool is_addressable(const ParsedAddress& address) noexcept {
  const bool has_postal = address.postal_code.size() == 5;
  const bool has_city = address.city.size() >= 2;
  return (has_postal && has_city) || address.full_address.size() >= 8;
}

}  // namespace labelscan::core
