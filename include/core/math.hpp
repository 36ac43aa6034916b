#pragma once

#include <algorithm>
#include <cmath>

namespace guardian::core {

inline float clamp_percent(const float value) noexcept {
  if (!std::isfinite(value)) {
    return 0.0F;
  }
  return std::clamp(value, 0.0F, 100.0F);
}

// alpha == 1 returns `value` unchanged.
inline constexpr float ema(const float previous, const float value, const float alpha) noexcept {
  return (alpha * value) + ((1.0F - alpha) * previous);
}

}  // namespace guardian::core
