#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/config.hpp"
#include "core/settings_store.hpp"
#include "model/process_policy.hpp"
#include "process/process_control.hpp"
#include "process/procfs.hpp"
#include "sensors/cpu.hpp"
#include "sensors/gpu/gpu.hpp"

using guardian::core::ConfigError;
using guardian::core::GuardianConfig;
using guardian::core::PersistedSettings;
using guardian::core::SettingsStore;
using guardian::model::match_mode;
using guardian::model::priority_level;
using guardian::process::ControlStatus;
using guardian::process::ProcessController;
using guardian::process::ProcessHandle;
using guardian::process::parse_proc_stat;
using guardian::sensors::CpuSensor;

namespace fs = std::filesystem;

namespace {

bool almost_equal(float a, float b, float eps = 1e-3F) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool write_temp_file(std::FILE* file, const std::string& content) {
  if (file == nullptr) {
    return false;
  }
  const int fd = fileno(file);
  if (fd < 0 || ftruncate(fd, 0) != 0) {
    return false;
  }
  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }
  if (!content.empty() && std::fwrite(content.data(), 1, content.size(), file) != content.size()) {
    return false;
  }
  std::fflush(file);
  return std::fseek(file, 0L, SEEK_SET) == 0;
}

bool write_file(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return out.good();
}

fs::path scratch_dir(const std::string& label) {
  const fs::path dir = fs::temp_directory_path() / ("guardian-" + label + "-" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

// Fields 4..18 are filler; 19 is nice and 22 is starttime.
std::string stat_line(const int pid, const std::string& comm, const char state, const int nice,
                      const unsigned long long start_time) {
  return std::to_string(pid) + " (" + comm + ") " + state + " 1 1 1 0 -1 4194304 0 0 0 0 3 1 0 0 20 " +
         std::to_string(nice) + " 1 0 " + std::to_string(start_time) + " 1048576 64\n";
}

bool add_fake_process(const fs::path& root, const int pid, const std::string& comm, const char state, const int nice,
                      const unsigned long long start_time) {
  const fs::path dir = root / std::to_string(pid);
  fs::create_directories(dir);
  return write_file(dir / "stat", stat_line(pid, comm.substr(0, 15), state, nice, start_time)) &&
         write_file(dir / "comm", comm.substr(0, 15) + "\n");
}

int test_cpu_sensor_with_injected_proc_stat() {
  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file, "cpu  200 0 100 700 0 0 0 0 0 0\ncpu0 100 0 50 350 0 0 0 0 0 0\n")) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "failed writing first snapshot");
  }

  CpuSensor sensor(stat_file, false);
  float cpu = -1.0F;
  if (!sensor.sample(cpu) || !almost_equal(cpu, 0.0F)) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "first sample should only set the baseline");
  }

  if (!write_temp_file(stat_file, "cpu  260 0 130 710 0 0 5 5 0 0\n")) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "failed writing second snapshot");
  }
  if (!sensor.sample(cpu) || !almost_equal(cpu, 90.909F)) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "utilization mismatch");
  }

  if (!write_temp_file(stat_file, "intr 12 0 0\n")) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "failed writing malformed snapshot");
  }
  cpu = 12.0F;
  if (sensor.sample(cpu) || cpu != 12.0F) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "malformed input must fail and leave the value alone");
  }

  std::fclose(stat_file);

  CpuSensor missing(nullptr, false);
  if (missing.sample(cpu)) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "missing file should fail");
  }
  return 0;
}

int test_cpu_counters_going_backwards() {
  using guardian::sensors::busy_percent;
  using guardian::sensors::CpuTimes;

  const auto parsed = guardian::sensors::parse_cpu_times("cpu  10 0 10 80\n");
  if (!parsed.has_value() || parsed->total != 100U || parsed->idle != 80U) {
    return fail("test_cpu_counters_going_backwards", "short cpu line should still parse");
  }
  if (guardian::sensors::parse_cpu_times("cpu0 1 2 3 4 5").has_value() ||
      guardian::sensors::parse_cpu_times("cpu  1 2").has_value()) {
    return fail("test_cpu_counters_going_backwards", "per-core or truncated lines accepted");
  }

  if (!almost_equal(busy_percent(CpuTimes{80, 100}, CpuTimes{40, 60}), 0.0F) ||
      !almost_equal(busy_percent(CpuTimes{80, 100}, CpuTimes{80, 100}), 0.0F)) {
    return fail("test_cpu_counters_going_backwards", "reset counters should read as idle");
  }
  if (!almost_equal(busy_percent(CpuTimes{80, 100}, CpuTimes{80, 150}), 100.0F)) {
    return fail("test_cpu_counters_going_backwards", "fully busy interval");
  }
  return 0;
}

int test_none_gpu_sensor_is_unavailable() {
  auto sensor = guardian::sensors::gpu::make_none_sensor();
  if (sensor->available() || sensor->utilization().has_value()) {
    return fail("test_none_gpu_sensor_is_unavailable", "none sensor must report unavailable");
  }
  return 0;
}

int test_parse_proc_stat() {
  const auto plain = parse_proc_stat(stat_line(4242, "game", 'S', 5, 987654));
  if (!plain.has_value() || plain->pid != 4242 || plain->comm != "game" || plain->state != 'S' ||
      plain->nice != 5 || plain->start_time != 987654ULL) {
    return fail("test_parse_proc_stat", "plain stat line misparsed");
  }

  const auto tricky = parse_proc_stat(stat_line(77, "we (ird) name", 'T', -3, 12));
  if (!tricky.has_value() || tricky->comm != "we (ird) name" || tricky->state != 'T' || tricky->nice != -3 ||
      tricky->start_time != 12ULL) {
    return fail("test_parse_proc_stat", "comm with spaces and parentheses misparsed");
  }

  if (parse_proc_stat("77 (short) S 1 2 3\n").has_value() || parse_proc_stat("garbage").has_value()) {
    return fail("test_parse_proc_stat", "truncated line accepted");
  }
  return 0;
}

int test_resolve_against_synthetic_proc() {
  const fs::path root = scratch_dir("proc");
  // Large pids keep the synthetic tree clear of the test's own pid.
  if (!add_fake_process(root, 4190001, "game", 'Z', 0, 100) || !add_fake_process(root, 4190002, "game", 'S', 0, 200) ||
      !add_fake_process(root, 4190003, "Game Launcher", 'S', 5, 300) ||
      !add_fake_process(root, 4190004, "averyveryverylongname", 'R', 0, 400)) {
    return fail("test_resolve_against_synthetic_proc", "failed to build synthetic proc tree");
  }
  fs::create_directories(root / "self");
  fs::create_directories(root / "sys");
  // All digits, but beyond the range of a pid.
  fs::create_directories(root / "99999999999999999999");

  // One thread of the launcher runs at a lower nice than its main thread.
  const fs::path tasks = root / "4190003" / "task";
  fs::create_directories(tasks / "4190003");
  fs::create_directories(tasks / "4190010");
  if (!write_file(tasks / "4190003" / "stat", stat_line(4190003, "Game Launcher", 'S', 5, 300)) ||
      !write_file(tasks / "4190010" / "stat", stat_line(4190010, "worker", 'S', 2, 301))) {
    return fail("test_resolve_against_synthetic_proc", "failed to build synthetic task tree");
  }

  auto controller = guardian::process::make_linux_process_controller(root.string());

  const auto exact = controller->resolve("game", match_mode::EXACT);
  if (!exact.has_value() || exact->pid != 4190002 || exact->start_time != 200ULL || exact->original_nice != 0) {
    return fail("test_resolve_against_synthetic_proc", "exact match should skip zombies and take the lowest pid");
  }

  const auto substring = controller->resolve("LAUNCHER", match_mode::SUBSTRING);
  if (!substring.has_value() || substring->pid != 4190003 || substring->original_nice != 5) {
    return fail("test_resolve_against_synthetic_proc", "substring match should ignore case");
  }

  const auto truncated = controller->resolve("averyveryverylongname", match_mode::EXACT);
  if (!truncated.has_value() || truncated->pid != 4190004) {
    return fail("test_resolve_against_synthetic_proc", "long names should match the truncated comm");
  }

  const auto launcher = controller->query(*substring);
  if (!launcher.has_value() || launcher->nice != 2) {
    return fail("test_resolve_against_synthetic_proc", "query should report the least-lowered thread");
  }

  if (controller->resolve("missing", match_mode::EXACT).has_value() ||
      controller->resolve("gam", match_mode::EXACT).has_value()) {
    return fail("test_resolve_against_synthetic_proc", "non-matching names resolved");
  }

  const auto status = controller->query(*exact);
  if (!status.has_value() || !status->alive || status->suspended || status->nice != 0) {
    return fail("test_resolve_against_synthetic_proc", "query of a running process");
  }

  add_fake_process(root, 4190002, "game", 'T', 10, 200);
  const auto stopped = controller->query(*exact);
  if (!stopped.has_value() || !stopped->suspended || stopped->nice != 10) {
    return fail("test_resolve_against_synthetic_proc", "stopped state and nice should be observed");
  }

  // Same pid, different start time: the pid was reused by another process.
  add_fake_process(root, 4190002, "game", 'S', 0, 999);
  if (controller->query(*exact).has_value() || controller->is_alive(*exact)) {
    return fail("test_resolve_against_synthetic_proc", "reused pid must not match the old handle");
  }
  if (controller->suspend(*exact) != ControlStatus::PROCESS_GONE ||
      controller->set_priority(*exact, priority_level::IDLE) != ControlStatus::PROCESS_GONE) {
    return fail("test_resolve_against_synthetic_proc", "operations on a stale handle must report process_gone");
  }

  fs::remove_all(root);
  return 0;
}

bool wait_for_suspended(ProcessController& controller, const ProcessHandle& handle, const bool expected) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (std::chrono::steady_clock::now() < deadline) {
    if (const auto status = controller.query(handle); status.has_value() && status->suspended == expected) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return false;
}

int test_control_of_a_real_child_process() {
  const pid_t child = ::fork();
  if (child < 0) {
    return fail("test_control_of_a_real_child_process", "fork failed");
  }
  if (child == 0) {
    for (;;) {
      ::pause();
    }
  }

  auto controller = guardian::process::make_linux_process_controller();
  std::optional<guardian::process::ProcStat> child_stat{};
  for (int attempt = 0; attempt < 100 && !child_stat.has_value(); ++attempt) {
    std::ifstream input("/proc/" + std::to_string(child) + "/stat");
    std::string content;
    std::getline(input, content);
    child_stat = parse_proc_stat(content);
  }

  int rc = 0;
  if (!child_stat.has_value()) {
    rc = fail("test_control_of_a_real_child_process", "child stat unreadable");
  } else {
    const ProcessHandle handle{child, child_stat->start_time, child_stat->nice, child_stat->comm};
    const int lowered = guardian::model::nice_for(priority_level::BELOW_NORMAL, child_stat->nice);

    if (controller->suspend(handle) != ControlStatus::OK || !wait_for_suspended(*controller, handle, true)) {
      rc = fail("test_control_of_a_real_child_process", "suspend did not stop the child");
    } else if (controller->suspend(handle) != ControlStatus::OK) {
      rc = fail("test_control_of_a_real_child_process", "suspending a stopped process should be a no-op");
    } else if (controller->resume(handle) != ControlStatus::OK || !wait_for_suspended(*controller, handle, false)) {
      rc = fail("test_control_of_a_real_child_process", "resume did not continue the child");
    } else if (controller->resume(handle) != ControlStatus::OK) {
      rc = fail("test_control_of_a_real_child_process", "resuming a running process should be a no-op");
    } else if (controller->set_priority(handle, priority_level::BELOW_NORMAL) != ControlStatus::OK ||
               controller->set_priority(handle, priority_level::BELOW_NORMAL) != ControlStatus::OK) {
      rc = fail("test_control_of_a_real_child_process", "lowering priority should succeed and be idempotent");
    } else if (const auto status = controller->query(handle); !status.has_value() || status->nice != lowered) {
      rc = fail("test_control_of_a_real_child_process", "child nice not lowered");
    }

    ::kill(child, SIGKILL);
    ::waitpid(child, nullptr, 0);
    if (rc == 0 && (controller->is_alive(handle) || controller->resume(handle) != ControlStatus::PROCESS_GONE)) {
      rc = fail("test_control_of_a_real_child_process", "reaped child should be gone");
    }
    return rc;
  }

  ::kill(child, SIGKILL);
  ::waitpid(child, nullptr, 0);
  return rc;
}

std::vector<int> task_nice_values(const pid_t pid) {
  std::vector<int> values;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator("/proc/" + std::to_string(pid) + "/task", ec)) {
    std::ifstream input(entry.path() / "stat");
    std::string content;
    std::getline(input, content);
    if (const auto task = parse_proc_stat(content); task.has_value()) {
      values.push_back(task->nice);
    }
  }
  return values;
}

int test_threaded_child_is_fully_controlled() {
  const pid_t child = ::fork();
  if (child < 0) {
    return fail("test_threaded_child_is_fully_controlled", "fork failed");
  }
  if (child == 0) {
    std::thread worker([] {
      for (;;) {
        ::pause();
      }
    });
    worker.detach();
    for (;;) {
      ::pause();
    }
  }

  auto controller = guardian::process::make_linux_process_controller();
  std::optional<guardian::process::ProcStat> child_stat{};
  for (int attempt = 0; attempt < 400; ++attempt) {
    std::ifstream input("/proc/" + std::to_string(child) + "/stat");
    std::string content;
    std::getline(input, content);
    child_stat = parse_proc_stat(content);
    if (child_stat.has_value() && task_nice_values(child).size() >= 2) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  int rc = 0;
  if (!child_stat.has_value() || task_nice_values(child).size() < 2) {
    rc = fail("test_threaded_child_is_fully_controlled", "worker thread never appeared");
  } else {
    const ProcessHandle handle{child, child_stat->start_time, child_stat->nice, child_stat->comm};
    const int lowered = guardian::model::nice_for(priority_level::BELOW_NORMAL, child_stat->nice);

    if (controller->set_priority(handle, priority_level::BELOW_NORMAL) != ControlStatus::OK) {
      rc = fail("test_threaded_child_is_fully_controlled", "lowering priority failed");
    } else {
      for (const int nice : task_nice_values(child)) {
        if (nice != lowered) {
          rc = fail("test_threaded_child_is_fully_controlled", "a thread kept its original nice");
          break;
        }
      }
    }

    // Stop and continue back to back, faster than the stat state letter follows.
    for (int i = 0; rc == 0 && i < 50; ++i) {
      if (controller->suspend(handle) != ControlStatus::OK || controller->resume(handle) != ControlStatus::OK) {
        rc = fail("test_threaded_child_is_fully_controlled", "suspend/resume pair failed");
      }
    }
    if (rc == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      const auto status = controller->query(handle);
      if (!status.has_value() || status->suspended) {
        rc = fail("test_threaded_child_is_fully_controlled", "child left stopped after a final resume");
      }
    }
  }

  ::kill(child, SIGKILL);
  ::waitpid(child, nullptr, 0);
  return rc;
}

int test_settings_store_round_trip() {
  const fs::path dir = scratch_dir("settings");
  SettingsStore store(dir / "nested" / "settings.json");

  if (store.load().has_value()) {
    return fail("test_settings_store_round_trip", "missing file should load as nothing");
  }

  GuardianConfig config{};
  config.cpu_throttle_threshold = 85.0F;
  config.cpu_recovery_threshold = 55.0F;
  config.poll_interval = std::chrono::milliseconds(500);
  config.target_process_name = "vivaldi";
  PersistedSettings ui{};
  ui.widget_x = 640;
  ui.widget_y = 24;
  ui.start_in_widget_mode = false;

  store.save(guardian::core::capture_settings(config, ui));
  const auto loaded = store.load();
  if (!loaded.has_value() || !almost_equal(loaded->cpu_throttle_threshold, 85.0F) ||
      !almost_equal(loaded->cpu_recovery_threshold, 55.0F) || loaded->poll_interval_ms != 500 ||
      loaded->target_process_name != "vivaldi") {
    return fail("test_settings_store_round_trip", "engine settings not persisted");
  }
  if (loaded->widget_x != 640 || loaded->widget_y != 24 || loaded->start_in_widget_mode) {
    return fail("test_settings_store_round_trip", "widget settings not persisted");
  }

  GuardianConfig restored{};
  restored.target_process_name = "from-file";
  guardian::core::apply_settings(*loaded, restored);
  if (restored.target_process_name != "vivaldi" || restored.poll_interval != std::chrono::milliseconds(500)) {
    return fail("test_settings_store_round_trip", "settings not applied to config");
  }

  PersistedSettings anonymous = *loaded;
  anonymous.target_process_name.clear();
  guardian::core::apply_settings(anonymous, restored);
  if (restored.target_process_name != "vivaldi") {
    return fail("test_settings_store_round_trip", "empty persisted target must not clear the configured one");
  }

  write_file(store.path(), "{\"thresholds\": [1, 2");
  try {
    (void)store.load();
    return fail("test_settings_store_round_trip", "malformed settings accepted");
  } catch (const ConfigError&) {
  }

  fs::remove_all(dir);
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_cpu_sensor_with_injected_proc_stat(); rc != 0) {
    return rc;
  }
  if (int rc = test_cpu_counters_going_backwards(); rc != 0) {
    return rc;
  }
  if (int rc = test_none_gpu_sensor_is_unavailable(); rc != 0) {
    return rc;
  }
  if (int rc = test_parse_proc_stat(); rc != 0) {
    return rc;
  }
  if (int rc = test_resolve_against_synthetic_proc(); rc != 0) {
    return rc;
  }
  if (int rc = test_control_of_a_real_child_process(); rc != 0) {
    return rc;
  }
  if (int rc = test_threaded_child_is_fully_controlled(); rc != 0) {
    return rc;
  }
  if (int rc = test_settings_store_round_trip(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] sensors unit tests\n";
  return 0;
}
