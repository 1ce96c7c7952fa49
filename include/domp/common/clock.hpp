#pragma once

#include <domp/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace domp::common {

/// Source of wall-clock Unix seconds. Injected wherever time drives a
/// decision so tests and replay can pin it.
using clock_fn_t = std::function<domp::schema::timestamp_seconds_t()>;

inline domp::schema::timestamp_seconds_t system_now() {
  return static_cast<domp::schema::timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

inline clock_fn_t make_system_clock() {
  return [] { return system_now(); };
}

}  // namespace domp::common
