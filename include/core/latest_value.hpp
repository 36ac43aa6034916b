#pragma once

#include <mutex>
#include <optional>
#include <utility>

namespace guardian::core {

// Single-slot handoff: a put() overwrites any value not yet taken, so the
// reader only ever sees the most recent one.
template <typename T>
class LatestValue {
 public:
  void put(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = std::move(value);
  }

  std::optional<T> take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<T> out = std::move(value_);
    value_.reset();
    return out;
  }

 private:
  std::mutex mutex_;
  std::optional<T> value_{};
};

}  // namespace guardian::core
