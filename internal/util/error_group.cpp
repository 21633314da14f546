#include "internal/util/error_group.hpp"

namespace catalog::util {

ErrorGroup::ErrorGroup(std::stop_token external) {
  if (external.stop_possible()) {
    external_.emplace(external, std::function<void()>([this] { stop_.request_stop(); }));
  }
}

ErrorGroup::~ErrorGroup() {
  stop_.request_stop();
  Join();
}

void ErrorGroup::Go(std::function<void(std::stop_token)> task) {
  threads_.emplace_back([this, task = std::move(task)] {
    try {
      task(stop_.get_token());
    } catch (...) {
      std::lock_guard lock(mutex_);
      if (!first_error_) {
        first_error_ = std::current_exception();
      }
      stop_.request_stop();
    }
  });
}

void ErrorGroup::Join() {
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void ErrorGroup::Wait() {
  Join();
  std::lock_guard lock(mutex_);
  if (first_error_) {
    std::rethrow_exception(first_error_);
  }
}

} // namespace catalog::util
