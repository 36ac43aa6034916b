#include "model/process_policy.hpp"

#include <stdexcept>
#include <string>

namespace guardian::model {

const char* to_string(const priority_level level) noexcept {
  switch (level) {
    case priority_level::NORMAL:
      return "normal";
    case priority_level::BELOW_NORMAL:
      return "below_normal";
    case priority_level::IDLE:
      return "idle";
  }
  return "unknown";
}

const char* to_string(const match_mode mode) noexcept {
  switch (mode) {
    case match_mode::EXACT:
      return "exact";
    case match_mode::SUBSTRING:
      return "substring";
  }
  return "unknown";
}

priority_level parse_priority_level(const std::string& value) {
  if (value == "normal") {
    return priority_level::NORMAL;
  }
  if (value == "below_normal") {
    return priority_level::BELOW_NORMAL;
  }
  if (value == "idle") {
    return priority_level::IDLE;
  }
  throw std::invalid_argument("unknown priority level: " + value);
}

match_mode parse_match_mode(const std::string& value) {
  if (value == "exact") {
    return match_mode::EXACT;
  }
  if (value == "substring") {
    return match_mode::SUBSTRING;
  }
  throw std::invalid_argument("unknown match mode: " + value);
}

}  // namespace guardian::model
