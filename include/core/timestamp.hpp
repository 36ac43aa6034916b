#pragma once

#include <chrono>
#include <cstdint>

namespace guardian::core {

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

inline float elapsed_ms(const std::chrono::steady_clock::time_point start,
                        const std::chrono::steady_clock::time_point end) {
  return std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(end - start).count();
}

}  // namespace guardian::core
