#include "process/target_ref.hpp"

#include <iostream>
#include <utility>

namespace guardian::process {

TargetProcessRef::TargetProcessRef(std::string name) : name_(std::move(name)) {}

const ProcessHandle* TargetProcessRef::acquire(ProcessController& controller, const model::match_mode mode) {
  if (handle_.has_value()) {
    if (controller.is_alive(*handle_)) {
      return &*handle_;
    }
    std::cerr << "[process] target '" << name_ << "' pid " << handle_->pid << " exited\n";
    handle_.reset();
  }

  if (name_.empty()) {
    return nullptr;
  }

  handle_ = controller.resolve(name_, mode);
  if (!handle_.has_value()) {
    return nullptr;
  }

  ++generation_;
  std::cerr << "[process] resolved target '" << name_ << "' to pid " << handle_->pid << " (" << handle_->name
            << ", nice " << handle_->original_nice << ")\n";
  return &*handle_;
}

}  // namespace guardian::process
