#pragma once

#include <keyward/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace keyward::common {

using clock_fn_t = std::function<keyward::schema::timestamp_milliseconds_t()>;

inline keyward::schema::timestamp_milliseconds_t now_milliseconds() {
  return static_cast<keyward::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace keyward::common
