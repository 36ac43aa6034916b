#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include "core/config.hpp"
#include "core/control_channel.hpp"
#include "core/guardian.hpp"
#include "core/load_sampler.hpp"
#include "core/settings_store.hpp"
#include "process/process_control.hpp"
#include "sensors/cpu.hpp"
#include "sensors/gpu/gpu.hpp"
#include "sinks/event_queue.hpp"
#include "sinks/json_lines.hpp"
#include "sinks/stdout_status.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

constexpr int kControlPollTimeoutMs = 200;

std::string format_config_settings(const guardian::core::GuardianConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[guardian] loaded config from " << config_path
         << " | target=" << config.target_process_name
         << " | match=" << guardian::model::to_string(config.match)
         << " | throttle_priority=" << guardian::model::to_string(config.throttle_priority)
         << " | cpu=" << config.cpu_throttle_threshold << '/' << config.cpu_recovery_threshold
         << " | gpu=" << config.gpu_throttle_threshold << '/' << config.gpu_recovery_threshold
         << " | poll_interval_ms=" << config.poll_interval.count()
         << " | settings=" << (config.settings_path.empty() ? "off" : config.settings_path);
  return output.str();
}

std::unique_ptr<guardian::sensors::gpu::GpuSensor> select_gpu_sensor(const guardian::core::GuardianConfig& config) {
  if (!config.gpu_enabled) {
    std::cerr << "[guardian] GPU sampling disabled by config\n";
    return guardian::sensors::gpu::make_none_sensor();
  }

  auto sensor = guardian::sensors::gpu::make_nvml_sensor(config.gpu_device_index);
  if (sensor != nullptr && sensor->available()) {
    std::cerr << "[guardian] detected NVML GPU sensor\n";
    return sensor;
  }
  std::cerr << "[guardian] NVML GPU sensor unavailable; throttling on CPU load only\n";
  return guardian::sensors::gpu::make_none_sensor();
}

// Reads control lines from stdin until quit, EOF or a shutdown signal.
void run_control_loop(guardian::core::Guardian& engine) {
  bool stdin_open = true;
  std::string pending;

  while (g_shutdown_requested == 0) {
    if (!stdin_open) {
      ::poll(nullptr, 0, kControlPollTimeoutMs);
      continue;
    }

    pollfd fd{STDIN_FILENO, POLLIN, 0};
    const int ready = ::poll(&fd, 1, kControlPollTimeoutMs);
    if (ready <= 0) {
      continue;
    }

    char buffer[256];
    const ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n <= 0) {
      stdin_open = false;
      continue;
    }
    pending.append(buffer, static_cast<std::size_t>(n));

    std::size_t newline = 0;
    while ((newline = pending.find('\n')) != std::string::npos) {
      const std::string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);

      const auto command = guardian::core::parse_control_command(line);
      if (!command.has_value()) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
          std::cerr << "[control] unrecognized command: " << line << '\n';
        }
        continue;
      }

      try {
        if (!guardian::core::dispatch_control_command(*command, engine)) {
          return;
        }
      } catch (const guardian::core::ConfigError& ex) {
        std::cerr << "[control] rejected: " << ex.what() << '\n';
      }
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/guardian.yaml";

  guardian::core::GuardianConfig config{};
  try {
    config = guardian::core::load_guardian_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::optional<guardian::core::SettingsStore> store{};
  guardian::core::PersistedSettings ui_settings{};
  if (!config.settings_path.empty()) {
    store.emplace(guardian::core::expand_home(config.settings_path));
    try {
      if (const auto saved = store->load(); saved.has_value()) {
        ui_settings = *saved;
        guardian::core::apply_settings(*saved, config);
        std::cerr << "[settings] restored last-used settings from " << store->path() << '\n';
      }
    } catch (const guardian::core::ConfigError& ex) {
      std::cerr << "[settings] ignoring saved settings: " << ex.what() << '\n';
    }
  }

  try {
    guardian::core::validate_config(config);
  } catch (const guardian::core::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  auto cpu_sensor = std::make_shared<guardian::sensors::CpuSensor>();
  guardian::core::LoadSampler sampler{[cpu_sensor](float& cpu) { return cpu_sensor->sample(cpu); },
                                      select_gpu_sensor(config)};

  auto events = std::make_shared<guardian::sinks::EventQueue>(config.event_buffer);
  guardian::sinks::EventDispatcher dispatcher{events};
  if (config.stdout_status) {
    dispatcher.subscribe(std::make_shared<guardian::sinks::StdoutStatusSink>());
  }
  if (config.json_events) {
    dispatcher.subscribe(std::make_shared<guardian::sinks::JsonLinesSink>(std::cout));
  }

  guardian::core::Guardian engine{config, std::move(sampler),
                                  guardian::process::make_platform_process_controller(), events};

  dispatcher.start();
  engine.start();
  run_control_loop(engine);
  engine.stop();
  dispatcher.stop();

  if (engine.state() == guardian::model::throttle_state::PANIC) {
    std::cerr << "[guardian] exiting in panic; target '" << engine.config().target_process_name
              << "' stays suspended\n";
  }

  if (events->dropped() > 0) {
    std::cerr << "[guardian] " << events->dropped() << " status events dropped by a slow consumer\n";
  }

  if (store.has_value()) {
    try {
      store->save(guardian::core::capture_settings(engine.config(), ui_settings));
      std::cerr << "[settings] saved to " << store->path() << '\n';
    } catch (const std::exception& ex) {
      std::cerr << "[settings] save failed: " << ex.what() << '\n';
    }
  }

  std::cerr << "[guardian] shutdown complete\n";
  return 0;
}
