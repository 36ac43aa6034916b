#pragma once

#include <optional>
#include <string>

#include "model/process_policy.hpp"
#include "process/process_control.hpp"

namespace guardian::process {

// Weak reference to the managed process: a lookup key plus a lazily revalidated
// handle. The OS process is never owned.
class TargetProcessRef {
 public:
  explicit TargetProcessRef(std::string name = {});

  const std::string& name() const noexcept { return name_; }

  // Returns the cached handle if it still refers to a live process, otherwise
  // resolves the name again. nullptr when no matching process exists.
  const ProcessHandle* acquire(ProcessController& controller, model::match_mode mode);

  // Cached handle without revalidation.
  const ProcessHandle* cached() const noexcept { return handle_.has_value() ? &*handle_ : nullptr; }

  // Drops the cached handle; the next acquire() resolves again.
  void invalidate() noexcept { handle_.reset(); }

  // Number of distinct process incarnations resolved so far.
  unsigned generation() const noexcept { return generation_; }

 private:
  std::string name_;
  std::optional<ProcessHandle> handle_{};
  unsigned generation_{0};
};

}  // namespace guardian::process
