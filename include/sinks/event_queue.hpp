#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

#include "model/engine_event.hpp"

namespace guardian::sinks {

class EventSubscriber {
 public:
  virtual void on_event(const model::engine_event& event) = 0;
  virtual ~EventSubscriber() = default;
};

// Bounded FIFO between the engine loop and observers. push() never blocks;
// when full the oldest event is discarded.
class EventQueue {
 public:
  explicit EventQueue(std::size_t capacity);

  void push(model::engine_event event);

  std::optional<model::engine_event> try_pop();
  std::optional<model::engine_event> wait_pop(std::chrono::milliseconds timeout);

  void set_capacity(std::size_t capacity);

  std::size_t size() const;
  std::uint64_t dropped() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<model::engine_event> events_;
  std::size_t capacity_;
  std::uint64_t dropped_{0};
};

// Drains an EventQueue on its own thread and fans events out to subscribers,
// so a slow observer never stalls the engine loop.
class EventDispatcher {
 public:
  explicit EventDispatcher(std::shared_ptr<EventQueue> queue);
  ~EventDispatcher();

  EventDispatcher(const EventDispatcher&) = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  // Must be called before start().
  void subscribe(std::shared_ptr<EventSubscriber> subscriber);

  void start();

  // Delivers whatever is still queued, then joins.
  void stop();

  // Delivers queued events on the caller's thread. Returns the number delivered.
  std::size_t drain();

 private:
  void run(std::stop_token stop);
  void deliver(const model::engine_event& event);

  std::shared_ptr<EventQueue> queue_;
  std::vector<std::shared_ptr<EventSubscriber>> subscribers_{};
  std::jthread thread_{};
};

}  // namespace guardian::sinks
