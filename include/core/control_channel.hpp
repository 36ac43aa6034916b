#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace guardian::core {

class Guardian;

enum class command_kind : std::uint8_t {
  PANIC_ON = 0,
  PANIC_OFF = 1,
  PANIC_TOGGLE = 2,
  TARGET = 3,
  QUIT = 4,
};

struct ControlCommand {
  command_kind kind{command_kind::QUIT};
  std::string argument{};
};

// Line protocol standing in for the presentation layer:
//   panic [on|off|toggle]   target <name>   quit
// Returns std::nullopt for blank or unrecognized lines.
std::optional<ControlCommand> parse_control_command(const std::string& line);

// Forwards a command into the engine. Returns false when the command asks to quit.
bool dispatch_control_command(const ControlCommand& command, Guardian& engine);

}  // namespace guardian::core
