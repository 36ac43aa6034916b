#include "sinks/stdout_status.hpp"

#include <cstdio>
#include <string>

namespace guardian::sinks {

void StdoutStatusSink::on_event(const model::engine_event& event) {
  char gpu[16] = "n/a";
  if (event.sample.gpu_available()) {
    std::snprintf(gpu, sizeof(gpu), "%.1f%%", *event.sample.gpu_percent);
  }

  std::printf("[status] #%llu %s (%s) cpu=%.1f%% gpu=%s%s target=%s pid=%d action=%s",
              static_cast<unsigned long long>(event.cycle), model::status_label(event), model::status_color(event),
              event.sample.cpu_percent, gpu, event.sample.stale ? " stale" : "", event.target.c_str(), event.pid,
              model::to_string(event.action));
  if (event.follow_up_action != model::engine_action::NONE) {
    std::printf("+%s", model::to_string(event.follow_up_action));
  }
  std::printf(" conditions=%s\n", model::describe_conditions(event.conditions).c_str());
  std::fflush(stdout);
}

}  // namespace guardian::sinks
