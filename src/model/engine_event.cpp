#include "model/engine_event.hpp"

#include <string>

namespace guardian::model {

const char* to_string(const throttle_state state) noexcept {
  switch (state) {
    case throttle_state::NORMAL:
      return "normal";
    case throttle_state::THROTTLED:
      return "throttled";
    case throttle_state::PANIC:
      return "panic";
  }
  return "unknown";
}

const char* to_string(const engine_action action) noexcept {
  switch (action) {
    case engine_action::NONE:
      return "none";
    case engine_action::PRIORITY_LOWERED:
      return "priority_lowered";
    case engine_action::PRIORITY_RESTORED:
      return "priority_restored";
    case engine_action::SUSPENDED:
      return "suspended";
    case engine_action::RESUMED:
      return "resumed";
  }
  return "unknown";
}

const char* to_string(const condition c) noexcept {
  switch (c) {
    case condition::SAMPLING_TRANSIENT_FAILURE:
      return "sampling_transient_failure";
    case condition::SAMPLING_DEGRADED:
      return "sampling_degraded";
    case condition::GPU_UNAVAILABLE:
      return "gpu_unavailable";
    case condition::PROCESS_GONE:
      return "process_gone";
    case condition::PERMISSION_DENIED:
      return "permission_denied";
    case condition::CONTROL_FAILED:
      return "control_failed";
    case condition::EXTERNALLY_STOPPED:
      return "externally_stopped";
    case condition::DRIFT_CORRECTED:
      return "drift_corrected";
    case condition::CYCLE_OVERRUN:
      return "cycle_overrun";
  }
  return "unknown";
}

std::string describe_conditions(const std::uint32_t conditions) {
  std::string out;
  for (const condition c : kAllConditions) {
    if ((conditions & bit(c)) == 0U) {
      continue;
    }
    if (!out.empty()) {
      out.push_back(',');
    }
    out += to_string(c);
  }
  return out.empty() ? std::string("none") : out;
}

const char* status_label(const engine_event& event) noexcept {
  if (event.degraded) {
    return "degraded";
  }
  return to_string(event.state);
}

const char* status_color(const engine_event& event) noexcept {
  if (event.degraded) {
    return "degraded";
  }
  switch (event.state) {
    case throttle_state::NORMAL:
      return "neutral";
    case throttle_state::THROTTLED:
      return "warning";
    case throttle_state::PANIC:
      return "alert";
  }
  return "neutral";
}

}  // namespace guardian::model
