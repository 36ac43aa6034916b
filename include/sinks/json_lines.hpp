#pragma once

#include <iosfwd>
#include <mutex>

#include <nlohmann/json.hpp>

#include "sinks/event_queue.hpp"

namespace guardian::sinks {

nlohmann::json to_json(const model::engine_event& event);

// Newline-delimited JSON, one object per engine cycle.
class JsonLinesSink final : public EventSubscriber {
 public:
  explicit JsonLinesSink(std::ostream& out) : out_(out) {}

  void on_event(const model::engine_event& event) override;

 private:
  std::ostream& out_;
  std::mutex mutex_;
};

}  // namespace guardian::sinks
