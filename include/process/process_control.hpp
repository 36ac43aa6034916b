#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "model/process_policy.hpp"

namespace guardian::process {

enum class ControlStatus : std::uint8_t {
  OK = 0,
  PERMISSION_DENIED = 1,
  PROCESS_GONE = 2,
  FAILED = 3,
};

const char* to_string(ControlStatus status) noexcept;

// Identifies one incarnation of a process. start_time distinguishes a reused pid.
struct ProcessHandle {
  int pid{0};
  std::uint64_t start_time{0};
  int original_nice{0};
  std::string name{};

  friend bool operator==(const ProcessHandle& lhs, const ProcessHandle& rhs) noexcept {
    return lhs.pid == rhs.pid && lhs.start_time == rhs.start_time;
  }
};

struct ProcessStatus {
  bool alive{false};
  bool suspended{false};
  int nice{0};
};

// Capability interface over the host's process control primitives. Mutating
// operations are idempotent: a request that matches the current state succeeds
// without touching the process.
class ProcessController {
 public:
  // First match wins; several processes sharing a name are not disambiguated.
  virtual std::optional<ProcessHandle> resolve(const std::string& name, model::match_mode mode) = 0;

  virtual ControlStatus set_priority(const ProcessHandle& handle, model::priority_level level) = 0;
  virtual ControlStatus suspend(const ProcessHandle& handle) = 0;
  virtual ControlStatus resume(const ProcessHandle& handle) = 0;
  virtual bool is_alive(const ProcessHandle& handle) = 0;

  // std::nullopt when the handle no longer refers to a live process.
  virtual std::optional<ProcessStatus> query(const ProcessHandle& handle) = 0;

  virtual ~ProcessController() = default;
};

// Linux implementation over procfs, setpriority(2) and SIGSTOP/SIGCONT.
// proc_root lets tests point resolution at a synthetic tree.
std::unique_ptr<ProcessController> make_linux_process_controller(std::string proc_root = "/proc");

// Picks the implementation for the host the binary runs on.
std::unique_ptr<ProcessController> make_platform_process_controller();

}  // namespace guardian::process
