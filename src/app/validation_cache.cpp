#include <labelscan/app/validation_cache.hpp>
#include <cctype>
#include <iterator>
#include <utility>

namespace labelscan::app {

ValidationCache::ValidationCache(std::size_t capacity, std::chrono::milliseconds ttl,
                                 std::size_t key_max_length)
    : capacity_(capacity), ttl_(ttl), key_max_length_(key_max_length) {}

std::string ValidationCache::make_key(std::string_view raw_text) const {
  std::string key;
  key.reserve(raw_text.size());
  bool pending_space = false;
  for (const char c : raw_text) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      pending_space = !key.empty();
      continue;
    }
    if (pending_space) {
      key += ' ';
      pending_space = false;
    }
    key += static_cast<char>(std::tolower(uc));
  }
  if (key.size() > key_max_length_) key.resize(key_max_length_);
  return key;
}

std::optional<ValidationResponse> ValidationCache::get(std::string_view raw_text,
                                                       Clock::time_point now) {
  const auto it = index_.find(make_key(raw_text));
  if (it == index_.end()) return std::nullopt;
  if (now - it->second->inserted >= ttl_) {
    entries_.erase(it->second);
    index_.erase(it);
    return std::nullopt;
  }
  return it->second->response;
}

void ValidationCache::put(std::string_view raw_text, ValidationResponse response,
                          Clock::time_point now) {
  if (capacity_ == 0) return;
  std::string key = make_key(raw_text);
  if (const auto it = index_.find(key); it != index_.end()) {
    entries_.erase(it->second);
    index_.erase(it);
  }
  entries_.push_back(Entry{key, std::move(response), now});
  index_.emplace(std::move(key), std::prev(entries_.end()));
  while (entries_.size() > capacity_) evict_oldest();
}

void ValidationCache::evict_oldest() {
  if (entries_.empty()) return;
  index_.erase(entries_.front().key);
  entries_.pop_front();
}

void ValidationCache::clear() {
  entries_.clear();
  index_.clear();
}

}  // namespace labelscan::app
