#pragma once

#include <cstdint>
#include <optional>

namespace guardian::model {

// One poll cycle's view of system load. Percentages are clamped to [0, 100].
// A missing GPU reading is "unavailable", never zero.
struct load_sample {
  float cpu_percent{0.0F};
  std::optional<float> gpu_percent{};
  std::uint64_t timestamp_ms{0};

  // Set when at least one value was carried over from the previous cycle.
  bool stale{false};

  [[nodiscard]] bool gpu_available() const noexcept { return gpu_percent.has_value(); }
};

}  // namespace guardian::model
