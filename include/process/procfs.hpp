#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace guardian::process {

// Fields of /proc/<pid>/stat the controller needs.
struct ProcStat {
  int pid{0};
  std::string comm{};
  char state{'?'};
  int nice{0};
  std::uint64_t start_time{0};
};

// comm may itself contain spaces and parentheses; fields are located after the last ')'.
std::optional<ProcStat> parse_proc_stat(const std::string& content);

// 'T' (stopped by signal). Tracing stops ('t') are not ours to resume.
inline bool is_stopped_state(const char state) noexcept { return state == 'T'; }

// Zombie or dead tasks can no longer be controlled.
inline bool is_exited_state(const char state) noexcept { return state == 'Z' || state == 'X' || state == 'x'; }

}  // namespace guardian::process
