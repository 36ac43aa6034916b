#include "core/control_channel.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>

#include "core/guardian.hpp"

namespace guardian::core {
namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

}  // namespace

std::optional<ControlCommand> parse_control_command(const std::string& line) {
  std::istringstream input(line);
  std::string verb;
  if (!(input >> verb)) {
    return std::nullopt;
  }
  verb = lowercase(verb);

  if (verb == "quit" || verb == "exit") {
    return ControlCommand{command_kind::QUIT, {}};
  }

  if (verb == "panic") {
    std::string mode;
    input >> mode;
    mode = lowercase(mode);
    if (mode.empty() || mode == "toggle") {
      return ControlCommand{command_kind::PANIC_TOGGLE, {}};
    }
    if (mode == "on") {
      return ControlCommand{command_kind::PANIC_ON, {}};
    }
    if (mode == "off") {
      return ControlCommand{command_kind::PANIC_OFF, {}};
    }
    return std::nullopt;
  }

  if (verb == "target") {
    std::string name;
    std::getline(input >> std::ws, name);
    while (!name.empty() && (name.back() == ' ' || name.back() == '\t' || name.back() == '\r')) {
      name.pop_back();
    }
    if (name.empty()) {
      return std::nullopt;
    }
    return ControlCommand{command_kind::TARGET, name};
  }

  return std::nullopt;
}

bool dispatch_control_command(const ControlCommand& command, Guardian& engine) {
  switch (command.kind) {
    case command_kind::PANIC_ON:
      engine.set_panic(true);
      break;
    case command_kind::PANIC_OFF:
      engine.set_panic(false);
      break;
    case command_kind::PANIC_TOGGLE:
      std::cerr << "[control] panic requested " << (engine.toggle_panic() ? "on" : "off") << '\n';
      break;
    case command_kind::TARGET:
      engine.set_target_process(command.argument);
      break;
    case command_kind::QUIT:
      return false;
  }
  return true;
}

}  // namespace guardian::core
