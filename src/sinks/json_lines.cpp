#include "sinks/json_lines.hpp"

#include <ostream>

namespace guardian::sinks {

nlohmann::json to_json(const model::engine_event& event) {
  nlohmann::json conditions = nlohmann::json::array();
  for (const model::condition c : model::kAllConditions) {
    if (event.has(c)) {
      conditions.push_back(model::to_string(c));
    }
  }

  return nlohmann::json{
      {"cycle", event.cycle},
      {"state", model::to_string(event.state)},
      {"status", model::status_label(event)},
      {"color", model::status_color(event)},
      {"cpu", event.sample.cpu_percent},
      {"gpu", event.sample.gpu_available() ? nlohmann::json(*event.sample.gpu_percent) : nlohmann::json(nullptr)},
      {"stale", event.sample.stale},
      {"timestamp_ms", event.sample.timestamp_ms},
      {"action", model::to_string(event.action)},
      {"follow_up_action", model::to_string(event.follow_up_action)},
      {"conditions", conditions},
      {"degraded", event.degraded},
      {"target", event.target},
      {"pid", event.pid},
  };
}

void JsonLinesSink::on_event(const model::engine_event& event) {
  const std::string line = to_json(event).dump();
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line << '\n';
  out_.flush();
}

}  // namespace guardian::sinks
