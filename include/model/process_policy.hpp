#pragma once

#include <cstdint>
#include <string>

namespace guardian::model {

enum class priority_level : std::uint8_t {
  NORMAL = 0,
  BELOW_NORMAL = 1,
  IDLE = 2,
};

enum class match_mode : std::uint8_t {
  EXACT = 0,
  SUBSTRING = 1,
};

inline constexpr int kBelowNormalNice = 10;
inline constexpr int kIdleNice = 19;

const char* to_string(priority_level level) noexcept;
const char* to_string(match_mode mode) noexcept;

// Both throw std::invalid_argument on unknown names.
priority_level parse_priority_level(const std::string& value);
match_mode parse_match_mode(const std::string& value);

// Nice value a process should run at for `level`, given the nice value it had
// when the engine first saw it. Lowering never raises an already-low priority.
inline constexpr int nice_for(const priority_level level, const int original_nice) noexcept {
  switch (level) {
    case priority_level::BELOW_NORMAL:
      return original_nice > kBelowNormalNice ? original_nice : kBelowNormalNice;
    case priority_level::IDLE:
      return kIdleNice;
    case priority_level::NORMAL:
      break;
  }
  return original_nice;
}

}  // namespace guardian::model
