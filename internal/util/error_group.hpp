#pragma once

#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace catalog::util {

/*
  Runs tasks on their own threads and keeps the first failure.

  The first task to throw requests stop on the group token; an external
  stop request does the same. Wait joins every task and rethrows the
  first failure.
*/
class ErrorGroup {
 public:
  explicit ErrorGroup(std::stop_token external = {});
  ~ErrorGroup();

  ErrorGroup(const ErrorGroup&)            = delete;
  ErrorGroup& operator=(const ErrorGroup&) = delete;

  void Go(std::function<void(std::stop_token)> task);

  void Wait();

  std::stop_token Token() const {
    return stop_.get_token();
  }

 private:
  void Join();

  std::stop_source                                       stop_;
  std::optional<std::stop_callback<std::function<void()>>> external_;
  std::vector<std::thread>                               threads_;
  std::mutex                                             mutex_;
  std::exception_ptr                                     first_error_;
};

} // namespace catalog::util
