#include <labelscan/app/config.hpp>
#include <labelscan/core/logging.hpp>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace labelscan::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::size_t to_size(const std::string& value) {
  if (!value.empty() && value[0] == '-') throw std::invalid_argument("negative");
  return static_cast<std::size_t>(std::stoul(value));
}

std::chrono::milliseconds to_ms(const std::string& value) {
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(to_size(value)));
}

bool to_bool(const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  throw std::invalid_argument("not a boolean");
}

bool known_log_level(const std::string& value) {
  return value == "off" || spdlog::level::from_str(value) != spdlog::level::off;
}

/// Returns false for an unknown key. Throws on a malformed value.
bool apply(ScannerConfig& c, const std::string& key, const std::string& value) {
  auto& t = c.tracker;
  auto& s = c.stability;
  auto& v = c.validation;

  if (key == "log_level") {
    if (!known_log_level(value)) throw std::invalid_argument("unknown level");
    c.log_level = value;
  }
  else if (key == "tracker.min_block_width") t.filter.min_width = std::stof(value);
  else if (key == "tracker.min_block_height") t.filter.min_height = std::stof(value);
  else if (key == "tracker.min_block_area") t.filter.min_area = std::stof(value);
  else if (key == "tracker.min_aspect_ratio") t.filter.min_aspect_ratio = std::stof(value);
  else if (key == "tracker.max_aspect_ratio") t.filter.max_aspect_ratio = std::stof(value);
  else if (key == "tracker.cluster_max_gap_y") t.cluster_max_gap_y = std::stof(value);
  else if (key == "tracker.min_cluster_blocks") t.min_cluster_blocks = to_size(value);
  else if (key == "tracker.area_weight") t.area_weight = std::stof(value);
  else if (key == "tracker.chars_weight") t.chars_weight = std::stof(value);
  else if (key == "tracker.tap_radius") t.tap_radius = std::stof(value);
  else if (key == "tracker.roi_width_ratio") t.roi_width_ratio = std::stof(value);
  else if (key == "tracker.roi_height_ratio") t.roi_height_ratio = std::stof(value);
  else if (key == "tracker.process_noise") t.process_noise = std::stof(value);
  else if (key == "tracker.measurement_noise") t.measurement_noise = std::stof(value);
  else if (key == "tracker.min_block_overlap") t.min_block_overlap = std::stof(value);
  else if (key == "stability.min_text_length") s.min_text_length = to_size(value);
  else if (key == "stability.similarity_threshold") s.similarity_threshold = std::stof(value);
  else if (key == "stability.locking_frames") s.locking_frames = std::stoi(value);
  else if (key == "stability.reading_frames") s.reading_frames = std::stoi(value);
  else if (key == "stability.unlock_frames") s.unlock_frames = std::stoi(value);
  else if (key == "stability.box_holdover_frames") s.box_holdover_frames = std::stoi(value);
  else if (key == "validation.scanning_min_confidence") v.scanning_min_confidence = std::stof(value);
  else if (key == "validation.validation_min_confidence") v.validation_min_confidence = std::stof(value);
  else if (key == "validation.debounce_ms") v.debounce = to_ms(value);
  else if (key == "validation.cache_capacity") v.cache_capacity = to_size(value);
  else if (key == "validation.cache_ttl_ms") v.cache_ttl = to_ms(value);
  else if (key == "validation.cache_key_max_length") v.cache_key_max_length = to_size(value);
  else if (key == "validation.min_server_confidence") v.min_server_confidence = std::stof(value);
  else if (key == "validation.manual_fallback_ms") v.manual_fallback = to_ms(value);
  else if (key == "queue.memoize") c.queue.memoize = to_bool(value);
  else return false;
  return true;
}

}  // namespace

ScannerConfig default_config() {
  return ScannerConfig{};
}

std::expected<ScannerConfig, core::ConfigError> read_config(const std::string& path) {
  ScannerConfig c = default_config();
  std::ifstream f(path);
  if (!f) return std::unexpected(core::ConfigError::FileNotFound);

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      core::logger()->warn("{}:{}: expected key=value", path, line_no);
      continue;
    }
    // Keep the previous value when the new one does not parse.
    ScannerConfig candidate = c;
    try {
      if (!apply(candidate, key, value)) {
        core::logger()->warn("{}:{}: unknown key '{}'", path, line_no, key);
        continue;
      }
    } catch (const std::exception&) {
      core::logger()->warn("{}:{}: invalid value '{}' for '{}', keeping default", path, line_no,
                           value, key);
      continue;
    }
    c = std::move(candidate);
  }
  return c;
}

ScannerConfig load_config(const std::string& path) {
  auto c = read_config(path);
  if (!c) {
    core::logger()->warn("config file '{}' not readable, using defaults", path);
    return default_config();
  }
  return *c;
}

}  // namespace labelscan::app
