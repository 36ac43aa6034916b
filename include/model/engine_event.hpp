#pragma once

#include <cstdint>
#include <string>

#include "model/load_sample.hpp"

namespace guardian::model {

enum class throttle_state : std::uint8_t {
  NORMAL = 0,
  THROTTLED = 1,
  PANIC = 2,
};

enum class engine_action : std::uint8_t {
  NONE = 0,
  PRIORITY_LOWERED = 1,
  PRIORITY_RESTORED = 2,
  SUSPENDED = 3,
  RESUMED = 4,
};

// Conditions reported by a cycle. Several may hold at once.
enum class condition : std::uint32_t {
  SAMPLING_TRANSIENT_FAILURE = 1U << 0U,
  SAMPLING_DEGRADED = 1U << 1U,
  GPU_UNAVAILABLE = 1U << 2U,
  PROCESS_GONE = 1U << 3U,
  PERMISSION_DENIED = 1U << 4U,
  CONTROL_FAILED = 1U << 5U,
  EXTERNALLY_STOPPED = 1U << 6U,
  DRIFT_CORRECTED = 1U << 7U,
  CYCLE_OVERRUN = 1U << 8U,
};

inline constexpr condition kAllConditions[] = {
    condition::SAMPLING_TRANSIENT_FAILURE, condition::SAMPLING_DEGRADED, condition::GPU_UNAVAILABLE,
    condition::PROCESS_GONE,               condition::PERMISSION_DENIED, condition::CONTROL_FAILED,
    condition::EXTERNALLY_STOPPED,         condition::DRIFT_CORRECTED,   condition::CYCLE_OVERRUN,
};

inline constexpr std::uint32_t bit(const condition c) noexcept { return static_cast<std::uint32_t>(c); }

// Snapshot handed to observers once per decision cycle. Not retained by the engine.
struct engine_event {
  std::uint64_t cycle{0};
  throttle_state state{throttle_state::NORMAL};
  load_sample sample{};
  engine_action action{engine_action::NONE};

  // Priority action applied right after a RESUMED when leaving PANIC.
  engine_action follow_up_action{engine_action::NONE};

  std::uint32_t conditions{0};
  bool degraded{false};
  int pid{0};
  std::string target{};

  [[nodiscard]] bool has(const condition c) const noexcept { return (conditions & bit(c)) != 0U; }
};

const char* to_string(throttle_state state) noexcept;
const char* to_string(engine_action action) noexcept;
const char* to_string(condition c) noexcept;

// Comma separated condition names, "none" when empty.
std::string describe_conditions(std::uint32_t conditions);

// "normal", "throttled", "panic", or "degraded" when failures persist.
const char* status_label(const engine_event& event) noexcept;

// Rendering hint for the presentation layer: neutral, warning, alert, degraded.
const char* status_color(const engine_event& event) noexcept;

}  // namespace guardian::model
