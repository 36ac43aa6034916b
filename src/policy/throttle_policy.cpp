#include "policy/throttle_policy.hpp"

namespace guardian::policy {

namespace {
bool over_throttle(const model::load_sample& sample, const Thresholds& thresholds) {
  if (sample.cpu_percent >= thresholds.cpu_throttle) {
    return true;
  }
  return sample.gpu_available() && *sample.gpu_percent >= thresholds.gpu_throttle;
}

bool under_recovery(const model::load_sample& sample, const Thresholds& thresholds) {
  if (sample.cpu_percent > thresholds.cpu_recovery) {
    return false;
  }
  return !sample.gpu_available() || *sample.gpu_percent <= thresholds.gpu_recovery;
}
}  // namespace

model::throttle_state next_state(const model::throttle_state current, const bool panic_active,
                                 const model::load_sample& sample, const Thresholds& thresholds) noexcept {
  if (panic_active) {
    return model::throttle_state::PANIC;
  }

  if (current != model::throttle_state::PANIC && over_throttle(sample, thresholds)) {
    return model::throttle_state::THROTTLED;
  }

  if (current == model::throttle_state::THROTTLED && under_recovery(sample, thresholds)) {
    return model::throttle_state::NORMAL;
  }

  if (current == model::throttle_state::PANIC) {
    return model::throttle_state::THROTTLED;
  }

  return current;
}

model::throttle_state ThrottleStateMachine::evaluate(const bool panic_active, const model::load_sample& sample) noexcept {
  state_ = next_state(state_, panic_active, sample, thresholds_);
  return state_;
}

}  // namespace guardian::policy
