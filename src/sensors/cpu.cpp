#include "sensors/cpu.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace guardian::sensors {
namespace {

// user nice system idle iowait irq softirq steal; guest time is already in user.
constexpr std::size_t kCpuFields = 8;
constexpr std::size_t kMinCpuFields = 4;
constexpr int kStatLineLength = 512;

}  // namespace

std::optional<CpuTimes> parse_cpu_times(const char* line) noexcept {
  if (std::strncmp(line, "cpu ", 4) != 0) {
    return std::nullopt;
  }

  std::uint64_t fields[kCpuFields]{};
  std::size_t count = 0;
  const char* cursor = line + 4;
  while (count < kCpuFields) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(cursor, &end, 10);
    if (end == cursor) {
      break;
    }
    if (errno != 0) {
      return std::nullopt;
    }
    fields[count++] = value;
    cursor = end;
  }

  if (count < kMinCpuFields) {
    return std::nullopt;
  }

  CpuTimes times{};
  times.idle = fields[3] + fields[4];
  for (std::size_t i = 0; i < kCpuFields; ++i) {
    times.total += fields[i];
  }
  return times;
}

float busy_percent(const CpuTimes& previous, const CpuTimes& current) noexcept {
  if (current.total <= previous.total || current.idle < previous.idle) {
    return 0.0F;
  }

  const std::uint64_t total_delta = current.total - previous.total;
  const std::uint64_t idle_delta = current.idle - previous.idle;
  if (idle_delta >= total_delta) {
    return 0.0F;
  }
  return (static_cast<float>(total_delta - idle_delta) / static_cast<float>(total_delta)) * 100.0F;
}

CpuSensor::CpuSensor() : file_(std::fopen("/proc/stat", "r")), owns_file_(true) {}

CpuSensor::CpuSensor(std::FILE* file, const bool owns_file) : file_(file), owns_file_(owns_file) {}

CpuSensor::~CpuSensor() {
  if (owns_file_ && file_ != nullptr) {
    std::fclose(file_);
  }
}

bool CpuSensor::sample(float& cpu_percent) noexcept {
  if (file_ == nullptr || std::fseek(file_, 0L, SEEK_SET) != 0) {
    return false;
  }

  char line[kStatLineLength]{};
  if (std::fgets(line, sizeof(line), file_) == nullptr) {
    return false;
  }

  const auto current = parse_cpu_times(line);
  if (!current.has_value()) {
    return false;
  }

  cpu_percent = previous_.has_value() ? busy_percent(*previous_, *current) : 0.0F;
  previous_ = current;
  return true;
}

}  // namespace guardian::sensors
