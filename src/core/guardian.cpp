#include "core/guardian.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/timestamp.hpp"

namespace guardian::core {
namespace {

using model::condition;
using model::engine_action;
using model::throttle_state;

GuardianConfig validated(GuardianConfig config) {
  validate_config(config);
  return config;
}

policy::Thresholds thresholds_from(const GuardianConfig& config) {
  return policy::Thresholds{config.cpu_throttle_threshold, config.cpu_recovery_threshold,
                            config.gpu_throttle_threshold, config.gpu_recovery_threshold};
}

SamplerOptions sampler_options_from(const GuardianConfig& config) {
  return SamplerOptions{config.sample_retries, config.degraded_after_cycles, config.smoothing_alpha};
}

}  // namespace

Guardian::Guardian(GuardianConfig config, LoadSampler sampler, std::unique_ptr<process::ProcessController> controller,
                   std::shared_ptr<sinks::EventQueue> events)
    : config_(validated(std::move(config))),
      sampler_(std::move(sampler)),
      controller_(std::move(controller)),
      events_(std::move(events)),
      machine_(thresholds_from(config_)),
      target_(config_.target_process_name) {
  if (controller_ == nullptr) {
    throw std::invalid_argument("guardian requires a process controller");
  }
  if (events_ == nullptr) {
    events_ = std::make_shared<sinks::EventQueue>(config_.event_buffer);
  }
  sampler_.set_options(sampler_options_from(config_));
}

Guardian::~Guardian() { stop(); }

void Guardian::set_panic(const bool active) {
  std::lock_guard<std::mutex> lock(panic_mutex_);
  panic_requested_ = active;
  panic_request_.put(active);
}

bool Guardian::toggle_panic() {
  std::lock_guard<std::mutex> lock(panic_mutex_);
  panic_requested_ = !panic_requested_;
  panic_request_.put(panic_requested_);
  return panic_requested_;
}

void Guardian::set_target_process(std::string name) {
  if (name.empty()) {
    throw ConfigError("target process name must not be empty");
  }
  target_request_.put(std::move(name));
}

void Guardian::reconfigure(GuardianConfig config) {
  validate_config(config);
  config_request_.put(std::move(config));
}

model::engine_event Guardian::run_cycle() {
  const auto cycle_start = std::chrono::steady_clock::now();

  model::engine_event event{};
  event.cycle = ++stats_.cycles;

  apply_pending_inputs(event);

  const SampleResult reading = sampler_.sample();
  event.sample = reading.sample;
  event.conditions |= reading.conditions;

  std::optional<process::ProcessHandle> handle{};
  if (const process::ProcessHandle* acquired = target_.acquire(*controller_, config_.match); acquired != nullptr) {
    handle = *acquired;
    target_missing_reported_ = false;
    if (target_.generation() != target_generation_) {
      target_generation_ = target_.generation();
      suspended_by_us_ = false;
      priority_lowered_by_us_ = false;
    }
  } else if (!target_missing_reported_) {
    std::cerr << "[process] target '" << target_.name() << "' not found; retrying every cycle\n";
    target_missing_reported_ = true;
  }

  const throttle_state previous = machine_.state();
  const throttle_state next = machine_.evaluate(panic_active_, event.sample);

  if (next != previous) {
    transition(previous, next, handle.has_value() ? &*handle : nullptr, event);
  } else if (handle.has_value()) {
    reconcile(next, *handle, event);
  } else {
    event.conditions |= model::bit(condition::PROCESS_GONE);
  }

  event.state = next;
  published_state_.store(next);
  event.target = target_.name();
  event.pid = target_.cached() != nullptr ? target_.cached()->pid : 0;

  const float elapsed = elapsed_ms(cycle_start, std::chrono::steady_clock::now());
  const auto budget_ms = static_cast<float>(config_.poll_interval.count());
  if (elapsed > budget_ms) {
    ++stats_.overruns;
    event.conditions |= model::bit(condition::CYCLE_OVERRUN);
    std::cerr << "[guardian] cycle " << event.cycle << " overran: " << elapsed << "ms > " << budget_ms << "ms\n";
  }

  update_health(event);
  events_->push(event);
  return event;
}

void Guardian::start() {
  if (thread_.joinable()) {
    return;
  }
  std::cerr << "[guardian] loop started: target='" << target_.name()
            << "' interval_ms=" << config_.poll_interval.count() << '\n';
  thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void Guardian::stop() {
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  thread_.join();
  std::cerr << "[guardian] loop stopped after " << stats_.cycles << " cycles in state "
            << model::to_string(machine_.state()) << '\n';
}

void Guardian::run(std::stop_token stop) {
  auto next_wakeup = std::chrono::steady_clock::now();
  while (!stop.stop_requested()) {
    run_cycle();

    next_wakeup += config_.poll_interval;
    const auto now = std::chrono::steady_clock::now();
    if (next_wakeup < now) {
      next_wakeup = now;
    }

    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_until(lock, stop, next_wakeup, [] { return false; });
  }
}

void Guardian::apply_pending_inputs(model::engine_event& event) {
  if (auto config = config_request_.take()) {
    apply_config(std::move(*config), event);
  }

  if (auto name = target_request_.take()) {
    switch_target(std::move(*name), event);
  }

  if (const auto panic = panic_request_.take(); panic.has_value() && *panic != panic_active_) {
    panic_active_ = *panic;
    std::cerr << "[guardian] panic " << (panic_active_ ? "engaged" : "released") << '\n';
  }
}

void Guardian::apply_config(GuardianConfig config, model::engine_event& event) {
  std::string requested_target = config.target_process_name;
  config.target_process_name = target_.name();
  config_ = std::move(config);

  machine_.set_thresholds(thresholds_from(config_));
  sampler_.set_options(sampler_options_from(config_));
  events_->set_capacity(config_.event_buffer);
  std::cerr << "[guardian] reconfigured: cpu " << config_.cpu_throttle_threshold << '/'
            << config_.cpu_recovery_threshold << " gpu " << config_.gpu_throttle_threshold << '/'
            << config_.gpu_recovery_threshold << " interval_ms=" << config_.poll_interval.count() << '\n';

  switch_target(std::move(requested_target), event);
}

void Guardian::switch_target(std::string name, model::engine_event& event) {
  if (name == target_.name()) {
    return;
  }

  release_target(event);
  std::cerr << "[guardian] target changed from '" << target_.name() << "' to '" << name << "'\n";
  target_ = process::TargetProcessRef(std::move(name));
  target_generation_ = 0;
  target_missing_reported_ = false;
  external_stop_reported_ = false;
  config_.target_process_name = target_.name();
}

void Guardian::release_target(model::engine_event& event) {
  if (const process::ProcessHandle* cached = target_.cached(); cached != nullptr) {
    const process::ProcessHandle handle = *cached;
    if (suspended_by_us_) {
      (void)resume_target(handle, event);
    }
    if (priority_lowered_by_us_) {
      (void)restore_priority(handle, event);
    }
  }
  suspended_by_us_ = false;
  priority_lowered_by_us_ = false;
}

void Guardian::transition(const throttle_state from, const throttle_state to, const process::ProcessHandle* handle,
                          model::engine_event& event) {
  ++stats_.transitions;
  std::cerr << "[guardian] " << model::to_string(from) << " -> " << model::to_string(to)
            << " (cpu=" << event.sample.cpu_percent << " gpu=";
  if (event.sample.gpu_available()) {
    std::cerr << *event.sample.gpu_percent;
  } else {
    std::cerr << "n/a";
  }
  std::cerr << ")\n";

  // The state reflects intent even when the target cannot be reached.
  if (handle == nullptr) {
    event.conditions |= model::bit(condition::PROCESS_GONE);
    return;
  }

  if (to == throttle_state::PANIC) {
    if (suspend_target(*handle, event)) {
      event.action = engine_action::SUSPENDED;
    }
    return;
  }

  bool resumed = false;
  if (from == throttle_state::PANIC) {
    if (!resume_target(*handle, event)) {
      return;
    }
    resumed = true;
  }

  engine_action priority_action = engine_action::NONE;
  if (to == throttle_state::THROTTLED) {
    if (lower_priority(*handle, event)) {
      priority_action = engine_action::PRIORITY_LOWERED;
    }
  } else if (restore_priority(*handle, event)) {
    priority_action = engine_action::PRIORITY_RESTORED;
  }

  if (resumed) {
    event.action = engine_action::RESUMED;
    event.follow_up_action = priority_action;
  } else {
    event.action = priority_action;
  }
}

void Guardian::reconcile(const throttle_state state, const process::ProcessHandle& handle,
                         model::engine_event& event) {
  const auto status = controller_->query(handle);
  if (!status.has_value()) {
    event.conditions |= model::bit(condition::PROCESS_GONE);
    target_.invalidate();
    return;
  }

  if (state == throttle_state::PANIC) {
    if (!status->suspended && suspend_target(handle, event)) {
      event.conditions |= model::bit(condition::DRIFT_CORRECTED);
      std::cerr << "[guardian] pid " << handle.pid << " was running during panic; suspended again\n";
    }
    return;
  }

  if (status->suspended) {
    if (suspended_by_us_) {
      if (resume_target(handle, event)) {
        event.conditions |= model::bit(condition::DRIFT_CORRECTED);
      }
    } else {
      event.conditions |= model::bit(condition::EXTERNALLY_STOPPED);
      if (!external_stop_reported_) {
        std::cerr << "[guardian] pid " << handle.pid << " is stopped by someone else; leaving it alone\n";
        external_stop_reported_ = true;
      }
    }
  } else {
    external_stop_reported_ = false;
  }

  if (state == throttle_state::THROTTLED) {
    if (status->nice < model::nice_for(config_.throttle_priority, handle.original_nice) &&
        lower_priority(handle, event)) {
      event.conditions |= model::bit(condition::DRIFT_CORRECTED);
      std::cerr << "[guardian] pid " << handle.pid << " priority drifted to nice " << status->nice
                << "; lowered again\n";
    }
    return;
  }

  if (priority_lowered_by_us_) {
    if (status->nice == handle.original_nice) {
      priority_lowered_by_us_ = false;
    } else if (restore_priority(handle, event)) {
      event.conditions |= model::bit(condition::DRIFT_CORRECTED);
    }
  }
}

bool Guardian::lower_priority(const process::ProcessHandle& handle, model::engine_event& event) {
  if (!check(controller_->set_priority(handle, config_.throttle_priority), "lower priority", handle, event)) {
    return false;
  }
  priority_lowered_by_us_ = true;
  return true;
}

bool Guardian::restore_priority(const process::ProcessHandle& handle, model::engine_event& event) {
  const process::ControlStatus status = controller_->set_priority(handle, model::priority_level::NORMAL);
  if (!check(status, "restore priority", handle, event)) {
    // Raising nice back needs CAP_SYS_NICE; without it no later attempt can succeed.
    if (status == process::ControlStatus::PERMISSION_DENIED) {
      std::cerr << "[process] pid " << handle.pid << " stays at its lowered priority (restoring needs CAP_SYS_NICE)\n";
      priority_lowered_by_us_ = false;
    }
    return false;
  }
  priority_lowered_by_us_ = false;
  return true;
}

bool Guardian::suspend_target(const process::ProcessHandle& handle, model::engine_event& event) {
  if (!check(controller_->suspend(handle), "suspend", handle, event)) {
    return false;
  }
  suspended_by_us_ = true;
  return true;
}

bool Guardian::resume_target(const process::ProcessHandle& handle, model::engine_event& event) {
  if (!check(controller_->resume(handle), "resume", handle, event)) {
    return false;
  }
  suspended_by_us_ = false;
  return true;
}

bool Guardian::check(const process::ControlStatus status, const char* operation, const process::ProcessHandle& handle,
                     model::engine_event& event) {
  switch (status) {
    case process::ControlStatus::OK:
      return true;
    case process::ControlStatus::PROCESS_GONE:
      event.conditions |= model::bit(condition::PROCESS_GONE);
      if (const process::ProcessHandle* cached = target_.cached(); cached != nullptr && *cached == handle) {
        target_.invalidate();
      }
      std::cerr << "[process] " << operation << " pid " << handle.pid << ": process gone\n";
      return false;
    case process::ControlStatus::PERMISSION_DENIED:
      event.conditions |= model::bit(condition::PERMISSION_DENIED);
      break;
    case process::ControlStatus::FAILED:
      event.conditions |= model::bit(condition::CONTROL_FAILED);
      break;
  }

  if (consecutive_control_failures_ == 0) {
    std::cerr << "[process] " << operation << " pid " << handle.pid << " failed: " << process::to_string(status)
              << '\n';
  }
  return false;
}

void Guardian::update_health(model::engine_event& event) {
  const bool control_failed = event.has(condition::PERMISSION_DENIED) || event.has(condition::CONTROL_FAILED);
  if (control_failed) {
    ++consecutive_control_failures_;
  } else {
    if (consecutive_control_failures_ >= config_.degraded_after_cycles) {
      std::cerr << "[process] control recovered after " << consecutive_control_failures_ << " failed cycles\n";
    }
    consecutive_control_failures_ = 0;
  }

  event.degraded =
      event.has(condition::SAMPLING_DEGRADED) || consecutive_control_failures_ >= config_.degraded_after_cycles;
}

}  // namespace guardian::core
