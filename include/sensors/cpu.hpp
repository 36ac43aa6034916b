#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>

namespace guardian::sensors {

// Jiffies from the aggregate "cpu" line of /proc/stat. iowait counts as idle.
struct CpuTimes {
  std::uint64_t idle{0};
  std::uint64_t total{0};
};

std::optional<CpuTimes> parse_cpu_times(const char* line) noexcept;

// Busy share of the interval between two snapshots, in percent. A counter that
// went backwards (hotplug, wrap) yields 0 instead of a bogus spike.
float busy_percent(const CpuTimes& previous, const CpuTimes& current) noexcept;

// Aggregate CPU utilization averaged over the window between two consecutive
// samples. The first sample only establishes the baseline and reports 0.
class CpuSensor {
 public:
  CpuSensor();
  explicit CpuSensor(std::FILE* file, bool owns_file = false);
  ~CpuSensor();

  CpuSensor(const CpuSensor&) = delete;
  CpuSensor& operator=(const CpuSensor&) = delete;

  // Returns false when /proc/stat cannot be read or parsed; cpu_percent is untouched then.
  bool sample(float& cpu_percent) noexcept;

 private:
  std::FILE* file_{nullptr};
  bool owns_file_{true};
  std::optional<CpuTimes> previous_{};
};

}  // namespace guardian::sensors
