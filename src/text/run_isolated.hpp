#pragma once

#include <labelscan/core/logging.hpp>
#include <exception>
#include <string_view>
#include <utility>

namespace labelscan::text::detail {

/// Runs one extraction step; an exception (e.g. regex complexity limits on
/// pathological input) is logged and replaced by an empty result.
template <typename Fn>
auto run_isolated(std::string_view step, Fn&& fn) -> decltype(fn()) {
  try {
    return std::forward<Fn>(fn)();
  } catch (const std::exception& e) {
    core::logger()->warn("{} failed: {}", step, e.what());
    return {};
  }
}

}  // namespace labelscan::text::detail
