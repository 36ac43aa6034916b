#include "sinks/event_queue.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace guardian::sinks {
namespace {
constexpr auto kDispatchPollInterval = std::chrono::milliseconds(100);
}  // namespace

EventQueue::EventQueue(const std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void EventQueue::push(model::engine_event event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    while (events_.size() >= capacity_) {
      events_.pop_front();
      ++dropped_;
    }
    events_.push_back(std::move(event));
  }
  ready_.notify_one();
}

std::optional<model::engine_event> EventQueue::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (events_.empty()) {
    return std::nullopt;
  }
  model::engine_event event = std::move(events_.front());
  events_.pop_front();
  return event;
}

std::optional<model::engine_event> EventQueue::wait_pop(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!ready_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
    return std::nullopt;
  }
  model::engine_event event = std::move(events_.front());
  events_.pop_front();
  return event;
}

void EventQueue::set_capacity(const std::size_t capacity) {
  std::lock_guard<std::mutex> lock(mutex_);
  capacity_ = capacity == 0 ? 1 : capacity;
  while (events_.size() > capacity_) {
    events_.pop_front();
    ++dropped_;
  }
}

std::size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

std::uint64_t EventQueue::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

EventDispatcher::EventDispatcher(std::shared_ptr<EventQueue> queue) : queue_(std::move(queue)) {}

EventDispatcher::~EventDispatcher() { stop(); }

void EventDispatcher::subscribe(std::shared_ptr<EventSubscriber> subscriber) {
  if (subscriber != nullptr) {
    subscribers_.push_back(std::move(subscriber));
  }
}

void EventDispatcher::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void EventDispatcher::stop() {
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  thread_.join();
  drain();
}

std::size_t EventDispatcher::drain() {
  std::size_t delivered = 0;
  while (auto event = queue_->try_pop()) {
    deliver(*event);
    ++delivered;
  }
  return delivered;
}

void EventDispatcher::run(std::stop_token stop) {
  while (!stop.stop_requested()) {
    if (auto event = queue_->wait_pop(kDispatchPollInterval)) {
      deliver(*event);
    }
  }
}

void EventDispatcher::deliver(const model::engine_event& event) {
  for (const auto& subscriber : subscribers_) {
    try {
      subscriber->on_event(event);
    } catch (const std::exception& ex) {
      std::cerr << "[events] subscriber failed on cycle " << event.cycle << ": " << ex.what() << '\n';
    }
  }
}

}  // namespace guardian::sinks
