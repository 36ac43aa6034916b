#pragma once

#include "sinks/event_queue.hpp"

namespace guardian::sinks {

// One human-readable status line per engine cycle.
class StdoutStatusSink final : public EventSubscriber {
 public:
  void on_event(const model::engine_event& event) override;
};

}  // namespace guardian::sinks
