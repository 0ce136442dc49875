#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace labelscan::core {

/// Shared "labelscan" logger (stderr, created on first use).
std::shared_ptr<spdlog::logger> logger();

/// Set the level from its name (trace, debug, info, warn, error, off).
/// Returns false and leaves the level unchanged for an unknown name.
bool set_log_level(std::string_view level);

}  // namespace labelscan::core
