#include <labelscan/core/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace labelscan::core {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("labelscan")) return existing;
    auto created = spdlog::stderr_color_mt("labelscan");
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::info);
    return created;
  }();
  return instance;
}

bool set_log_level(std::string_view level) {
  const std::string name(level);
  const auto parsed = spdlog::level::from_str(name);
  if (parsed == spdlog::level::off && name != "off") return false;
  logger()->set_level(parsed);
  return true;
}

}  // namespace labelscan::core
