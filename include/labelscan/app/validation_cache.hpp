#pragma once

#include <labelscan/app/validation_client.hpp>
#include <chrono>
#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace labelscan::app {

/// Bounded cache of accepted server responses keyed by normalized raw text.
///
/// Entries expire \p ttl after insertion. Re-inserting a key moves it to the
/// newest position; when full the oldest entry is evicted.
class ValidationCache {
 public:
  using Clock = std::chrono::steady_clock;

  ValidationCache(std::size_t capacity, std::chrono::milliseconds ttl,
                  std::size_t key_max_length = 200);

  /// Lower-cased, whitespace-collapsed, trimmed and truncated form of \p raw_text.
  [[nodiscard]] std::string make_key(std::string_view raw_text) const;

  /// Fresh entry for \p raw_text; an expired entry is removed and reported as a miss.
  [[nodiscard]] std::optional<ValidationResponse> get(std::string_view raw_text, Clock::time_point now);

  void put(std::string_view raw_text, ValidationResponse response, Clock::time_point now);

  void evict_oldest();
  void clear();

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

 private:
  struct Entry {
    std::string key;
    ValidationResponse response;
    Clock::time_point inserted;
  };

  std::size_t capacity_;
  std::chrono::milliseconds ttl_;
  std::size_t key_max_length_;
  std::list<Entry> entries_;  // oldest first
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

}  // namespace labelscan::app
