#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/latest_value.hpp"
#include "core/load_sampler.hpp"
#include "model/engine_event.hpp"
#include "policy/throttle_policy.hpp"
#include "process/process_control.hpp"
#include "process/target_ref.hpp"
#include "sinks/event_queue.hpp"

namespace guardian::core {

struct GuardianStats {
  std::uint64_t cycles{0};
  std::uint64_t transitions{0};
  std::uint64_t overruns{0};
};

// The sampling/decision loop. The loop thread is the only writer of the
// throttle state and the only caller of mutating process operations; inputs
// from other threads go through latest-value slots read at cycle start.
class Guardian {
 public:
  // Throws ConfigError when the config fails validation.
  Guardian(GuardianConfig config, LoadSampler sampler, std::unique_ptr<process::ProcessController> controller,
           std::shared_ptr<sinks::EventQueue> events = nullptr);
  ~Guardian();

  Guardian(const Guardian&) = delete;
  Guardian& operator=(const Guardian&) = delete;

  // Thread-safe inputs, applied at the start of the next cycle.
  void set_panic(bool active);
  bool toggle_panic();
  void set_target_process(std::string name);

  // Validates on the caller's thread (throws ConfigError) and swaps the whole
  // config in between cycles.
  void reconfigure(GuardianConfig config);

  // Runs one cycle on the calling thread. Not to be mixed with start().
  model::engine_event run_cycle();

  void start();

  // Honored between cycles. A suspended target stays suspended.
  void stop();

  [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }

  [[nodiscard]] model::throttle_state state() const noexcept { return published_state_.load(); }

  // Loop-owned; read only from the loop thread or after stop().
  [[nodiscard]] const GuardianConfig& config() const noexcept { return config_; }
  [[nodiscard]] const GuardianStats& stats() const noexcept { return stats_; }

  [[nodiscard]] const std::shared_ptr<sinks::EventQueue>& events() const noexcept { return events_; }

 private:
  void run(std::stop_token stop);

  void apply_pending_inputs(model::engine_event& event);
  void apply_config(GuardianConfig config, model::engine_event& event);
  void switch_target(std::string name, model::engine_event& event);
  void release_target(model::engine_event& event);

  void transition(model::throttle_state from, model::throttle_state to, const process::ProcessHandle* handle,
                  model::engine_event& event);
  void reconcile(model::throttle_state state, const process::ProcessHandle& handle, model::engine_event& event);

  bool lower_priority(const process::ProcessHandle& handle, model::engine_event& event);
  bool restore_priority(const process::ProcessHandle& handle, model::engine_event& event);
  bool suspend_target(const process::ProcessHandle& handle, model::engine_event& event);
  bool resume_target(const process::ProcessHandle& handle, model::engine_event& event);
  bool check(process::ControlStatus status, const char* operation, const process::ProcessHandle& handle,
             model::engine_event& event);

  void update_health(model::engine_event& event);

  GuardianConfig config_;
  LoadSampler sampler_;
  std::unique_ptr<process::ProcessController> controller_;
  std::shared_ptr<sinks::EventQueue> events_;
  policy::ThrottleStateMachine machine_;
  process::TargetProcessRef target_;
  unsigned target_generation_{0};

  // What this engine has done to the current target incarnation.
  bool suspended_by_us_{false};
  bool priority_lowered_by_us_{false};

  bool panic_active_{false};
  bool target_missing_reported_{false};
  bool external_stop_reported_{false};
  std::uint32_t consecutive_control_failures_{0};
  GuardianStats stats_{};

  LatestValue<bool> panic_request_{};
  LatestValue<std::string> target_request_{};
  LatestValue<GuardianConfig> config_request_{};
  std::mutex panic_mutex_;
  bool panic_requested_{false};
  std::atomic<model::throttle_state> published_state_{model::throttle_state::NORMAL};

  std::mutex wake_mutex_;
  std::condition_variable_any wake_;
  std::jthread thread_{};
};

}  // namespace guardian::core
