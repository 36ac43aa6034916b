#pragma once

#include "model/engine_event.hpp"
#include "model/load_sample.hpp"

namespace guardian::policy {

struct Thresholds {
  float cpu_throttle{90.0F};
  float cpu_recovery{75.0F};
  float gpu_throttle{90.0F};
  float gpu_recovery{75.0F};
};

// Pure transition function. Rules, first match wins:
//   1. panic active                                   -> PANIC
//   2. not PANIC, cpu or available gpu at throttle     -> THROTTLED
//   3. THROTTLED, cpu and available gpu at recovery    -> NORMAL
//   4. PANIC, panic released                           -> THROTTLED
//   5. otherwise unchanged
model::throttle_state next_state(model::throttle_state current, bool panic_active, const model::load_sample& sample,
                                 const Thresholds& thresholds) noexcept;

class ThrottleStateMachine {
 public:
  explicit ThrottleStateMachine(Thresholds thresholds = {}) noexcept : thresholds_(thresholds) {}

  // Applies one cycle's inputs and returns the resulting state.
  model::throttle_state evaluate(bool panic_active, const model::load_sample& sample) noexcept;

  model::throttle_state state() const noexcept { return state_; }

  void set_thresholds(const Thresholds& thresholds) noexcept { thresholds_ = thresholds; }

 private:
  Thresholds thresholds_;
  model::throttle_state state_{model::throttle_state::NORMAL};
};

}  // namespace guardian::policy
