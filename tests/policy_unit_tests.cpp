#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/engine_event.hpp"
#include "model/load_sample.hpp"
#include "model/process_policy.hpp"
#include "policy/throttle_policy.hpp"

using guardian::core::ConfigError;
using guardian::core::GuardianConfig;
using guardian::core::parse_guardian_config;
using guardian::core::validate_config;
using guardian::model::load_sample;
using guardian::model::match_mode;
using guardian::model::priority_level;
using guardian::model::throttle_state;
using guardian::policy::next_state;
using guardian::policy::Thresholds;
using guardian::policy::ThrottleStateMachine;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

load_sample cpu_only(const float cpu) {
  load_sample sample{};
  sample.cpu_percent = cpu;
  return sample;
}

load_sample with_gpu(const float cpu, const float gpu) {
  load_sample sample = cpu_only(cpu);
  sample.gpu_percent = gpu;
  return sample;
}

Thresholds scenario_thresholds() { return Thresholds{80.0F, 60.0F, 90.0F, 75.0F}; }

GuardianConfig valid_config() {
  GuardianConfig config{};
  config.cpu_throttle_threshold = 80.0F;
  config.cpu_recovery_threshold = 60.0F;
  config.target_process_name = "game";
  return config;
}

bool rejects(const GuardianConfig& config) {
  try {
    validate_config(config);
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

int test_cpu_sequence_scenario() {
  ThrottleStateMachine machine(scenario_thresholds());
  const std::vector<float> cpu = {50.0F, 85.0F, 85.0F, 70.0F, 55.0F};
  const std::vector<throttle_state> expected = {throttle_state::NORMAL, throttle_state::THROTTLED,
                                                throttle_state::THROTTLED, throttle_state::THROTTLED,
                                                throttle_state::NORMAL};

  for (std::size_t i = 0; i < cpu.size(); ++i) {
    if (machine.evaluate(false, cpu_only(cpu[i])) != expected[i]) {
      return fail("test_cpu_sequence_scenario", "state sequence mismatch");
    }
  }
  return 0;
}

int test_hysteresis_band_does_not_chatter() {
  ThrottleStateMachine machine(scenario_thresholds());
  machine.evaluate(false, cpu_only(85.0F));

  int transitions = 0;
  throttle_state previous = machine.state();
  const std::vector<float> band = {79.9F, 61.0F, 75.0F, 60.1F, 79.0F, 65.0F, 70.0F, 62.0F};
  for (const float cpu : band) {
    const throttle_state state = machine.evaluate(false, cpu_only(cpu));
    if (state != previous) {
      ++transitions;
    }
    previous = state;
  }

  if (transitions != 0 || machine.state() != throttle_state::THROTTLED) {
    return fail("test_hysteresis_band_does_not_chatter", "state changed inside the hysteresis band");
  }

  if (machine.evaluate(false, cpu_only(60.0F)) != throttle_state::NORMAL) {
    return fail("test_hysteresis_band_does_not_chatter", "recovery threshold is inclusive");
  }

  // Back below the throttle threshold from NORMAL does nothing either.
  if (machine.evaluate(false, cpu_only(79.9F)) != throttle_state::NORMAL) {
    return fail("test_hysteresis_band_does_not_chatter", "NORMAL must hold below the throttle threshold");
  }
  return 0;
}

int test_panic_wins_from_every_state() {
  const Thresholds thresholds = scenario_thresholds();
  for (const throttle_state from : {throttle_state::NORMAL, throttle_state::THROTTLED, throttle_state::PANIC}) {
    for (const float cpu : {0.0F, 70.0F, 100.0F}) {
      if (next_state(from, true, cpu_only(cpu), thresholds) != throttle_state::PANIC) {
        return fail("test_panic_wins_from_every_state", "active panic must yield PANIC");
      }
    }
  }
  return 0;
}

int test_panic_release_goes_through_throttled() {
  ThrottleStateMachine machine(scenario_thresholds());
  machine.evaluate(true, cpu_only(5.0F));

  if (machine.evaluate(false, cpu_only(5.0F)) != throttle_state::THROTTLED) {
    return fail("test_panic_release_goes_through_throttled", "released panic must land in THROTTLED");
  }

  if (machine.evaluate(false, cpu_only(5.0F)) != throttle_state::NORMAL) {
    return fail("test_panic_release_goes_through_throttled", "low load should recover on the following cycle");
  }

  machine.evaluate(true, cpu_only(99.0F));
  if (machine.evaluate(false, cpu_only(99.0F)) != throttle_state::THROTTLED) {
    return fail("test_panic_release_goes_through_throttled", "released panic under load stays THROTTLED");
  }
  return 0;
}

int test_gpu_load_throttles_and_blocks_recovery() {
  const Thresholds thresholds = scenario_thresholds();

  if (next_state(throttle_state::NORMAL, false, with_gpu(10.0F, 90.0F), thresholds) != throttle_state::THROTTLED) {
    return fail("test_gpu_load_throttles_and_blocks_recovery", "gpu at threshold should throttle");
  }

  if (next_state(throttle_state::THROTTLED, false, with_gpu(10.0F, 80.0F), thresholds) != throttle_state::THROTTLED) {
    return fail("test_gpu_load_throttles_and_blocks_recovery", "gpu above recovery must hold THROTTLED");
  }

  if (next_state(throttle_state::THROTTLED, false, with_gpu(10.0F, 75.0F), thresholds) != throttle_state::NORMAL) {
    return fail("test_gpu_load_throttles_and_blocks_recovery", "cpu and gpu at recovery should restore NORMAL");
  }
  return 0;
}

int test_unavailable_gpu_leaves_cpu_in_charge() {
  Thresholds thresholds = scenario_thresholds();
  thresholds.gpu_throttle = 1.0F;
  thresholds.gpu_recovery = 0.0F;

  ThrottleStateMachine machine(thresholds);
  const std::vector<float> cpu = {10.0F, 79.0F, 80.0F, 61.0F, 60.0F, 0.0F};
  const std::vector<throttle_state> expected = {throttle_state::NORMAL,    throttle_state::NORMAL,
                                                throttle_state::THROTTLED, throttle_state::THROTTLED,
                                                throttle_state::NORMAL,    throttle_state::NORMAL};
  for (std::size_t i = 0; i < cpu.size(); ++i) {
    if (machine.evaluate(false, cpu_only(cpu[i])) != expected[i]) {
      return fail("test_unavailable_gpu_leaves_cpu_in_charge", "gpu thresholds leaked into a cpu-only run");
    }
  }
  return 0;
}

int test_config_validation_rules() {
  if (rejects(valid_config())) {
    return fail("test_config_validation_rules", "valid config rejected");
  }

  GuardianConfig no_gap = valid_config();
  no_gap.cpu_recovery_threshold = no_gap.cpu_throttle_threshold;
  if (!rejects(no_gap)) {
    return fail("test_config_validation_rules", "cpu thresholds without a hysteresis gap accepted");
  }

  GuardianConfig gpu_inverted = valid_config();
  gpu_inverted.gpu_recovery_threshold = 95.0F;
  if (!rejects(gpu_inverted)) {
    return fail("test_config_validation_rules", "gpu recovery above throttle accepted");
  }

  GuardianConfig zero_interval = valid_config();
  zero_interval.poll_interval = std::chrono::milliseconds(0);
  if (!rejects(zero_interval)) {
    return fail("test_config_validation_rules", "non-positive poll interval accepted");
  }

  GuardianConfig no_target = valid_config();
  no_target.target_process_name.clear();
  if (!rejects(no_target)) {
    return fail("test_config_validation_rules", "empty target accepted");
  }

  GuardianConfig bad_alpha = valid_config();
  bad_alpha.smoothing_alpha = 0.0F;
  if (!rejects(bad_alpha)) {
    return fail("test_config_validation_rules", "zero smoothing alpha accepted");
  }

  GuardianConfig no_step = valid_config();
  no_step.throttle_priority = priority_level::NORMAL;
  if (!rejects(no_step)) {
    return fail("test_config_validation_rules", "throttle priority that lowers nothing accepted");
  }

  GuardianConfig out_of_range = valid_config();
  out_of_range.cpu_throttle_threshold = 120.0F;
  if (!rejects(out_of_range)) {
    return fail("test_config_validation_rules", "threshold above 100 accepted");
  }
  return 0;
}

int test_config_parsing() {
  std::istringstream input(
      "# guardian test config\n"
      "thresholds:\n"
      "  cpu:\n"
      "    throttle: 85\n"
      "    recovery: 65   # inline comment\n"
      "  gpu:\n"
      "    throttle: 95\n"
      "    recovery: 70\n"
      "poll_interval_ms: 250\n"
      "target:\n"
      "  name: \"my game\"\n"
      "  match: substring\n"
      "  throttle_priority: idle\n"
      "sampling:\n"
      "  retries: 4\n"
      "  smoothing_alpha: 0.5\n"
      "sensors:\n"
      "  gpu: off\n"
      "events:\n"
      "  buffer: 8\n"
      "  json: yes\n"
      "unknown_key: ignored\n");

  const GuardianConfig config = parse_guardian_config(input);
  if (config.cpu_throttle_threshold != 85.0F || config.cpu_recovery_threshold != 65.0F ||
      config.gpu_throttle_threshold != 95.0F || config.gpu_recovery_threshold != 70.0F) {
    return fail("test_config_parsing", "thresholds parsed incorrectly");
  }
  if (config.poll_interval != std::chrono::milliseconds(250) || config.target_process_name != "my game") {
    return fail("test_config_parsing", "interval or target parsed incorrectly");
  }
  if (config.match != match_mode::SUBSTRING || config.throttle_priority != priority_level::IDLE) {
    return fail("test_config_parsing", "target policy parsed incorrectly");
  }
  if (config.sample_retries != 4 || config.smoothing_alpha != 0.5F || config.gpu_enabled ||
      config.event_buffer != 8 || !config.json_events) {
    return fail("test_config_parsing", "sampling or events section parsed incorrectly");
  }

  std::istringstream bad_number("poll_interval_ms: soon\n");
  try {
    (void)parse_guardian_config(bad_number);
    return fail("test_config_parsing", "non-numeric interval accepted");
  } catch (const ConfigError& ex) {
    if (std::string(ex.what()).find("poll_interval_ms") == std::string::npos) {
      return fail("test_config_parsing", "error should name the offending key");
    }
  }

  std::istringstream bad_mode("target:\n  match: fuzzy\n");
  try {
    (void)parse_guardian_config(bad_mode);
    return fail("test_config_parsing", "unknown match mode accepted");
  } catch (const ConfigError&) {
  }

  try {
    (void)guardian::core::load_guardian_config("/nonexistent/guardian.yaml");
    return fail("test_config_parsing", "missing file should throw");
  } catch (const ConfigError&) {
  }
  return 0;
}

int test_nice_mapping_never_raises_priority() {
  using guardian::model::nice_for;
  if (nice_for(priority_level::BELOW_NORMAL, 0) != 10 || nice_for(priority_level::IDLE, 0) != 19) {
    return fail("test_nice_mapping_never_raises_priority", "default step mapping mismatch");
  }
  if (nice_for(priority_level::BELOW_NORMAL, 15) != 15) {
    return fail("test_nice_mapping_never_raises_priority", "lowering must not raise an already-low priority");
  }
  if (nice_for(priority_level::NORMAL, -5) != -5) {
    return fail("test_nice_mapping_never_raises_priority", "restore should return the original nice");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_cpu_sequence_scenario(); rc != 0) {
    return rc;
  }
  if (int rc = test_hysteresis_band_does_not_chatter(); rc != 0) {
    return rc;
  }
  if (int rc = test_panic_wins_from_every_state(); rc != 0) {
    return rc;
  }
  if (int rc = test_panic_release_goes_through_throttled(); rc != 0) {
    return rc;
  }
  if (int rc = test_gpu_load_throttles_and_blocks_recovery(); rc != 0) {
    return rc;
  }
  if (int rc = test_unavailable_gpu_leaves_cpu_in_charge(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_validation_rules(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_parsing(); rc != 0) {
    return rc;
  }
  if (int rc = test_nice_mapping_never_raises_priority(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] policy unit tests\n";
  return 0;
}
