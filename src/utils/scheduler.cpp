// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "utils/scheduler.hpp"

#include "utils/thread.hpp"

namespace predacl::utils {

void Scheduler::Run(const std::string &service_name, const std::function<void()> &f) {
  Stop();
  {
    std::lock_guard guard(mutex_);
    next_execution_ = period_ > std::chrono::milliseconds(0) ? Clock::now() + period_ : Clock::time_point::max();
  }
  thread_ = std::jthread([this, f, service_name](std::stop_token token) { ThreadRun(service_name, f, token); });
}

void Scheduler::SetInterval(std::chrono::milliseconds period) {
  {
    std::lock_guard guard(mutex_);
    period_ = period;
    next_execution_ = period > std::chrono::milliseconds(0) ? Clock::now() + period : Clock::time_point::max();
  }
  condition_variable_.notify_one();
}

// A scheduler that was never started has no stop state, so stop_possible()
// tells it apart from a running one.
bool Scheduler::IsRunning() const {
  const auto token = thread_.get_stop_token();
  return token.stop_possible() && !token.stop_requested();
}

void Scheduler::ThreadRun(std::string service_name, std::function<void()> f, std::stop_token token) {
  utils::ThreadSetName(service_name);

  while (true) {
    {
      std::unique_lock lock(mutex_);
      // Woken up early by SetInterval or spuriously; the predicate rechecks the
      // possibly changed deadline.
      while (!token.stop_requested() && Clock::now() < next_execution_) {
        if (next_execution_ == Clock::time_point::max()) {
          condition_variable_.wait(lock, token, [&] { return next_execution_ != Clock::time_point::max(); });
        } else {
          const auto deadline = next_execution_;
          condition_variable_.wait_until(lock, token, deadline, [&] { return next_execution_ != deadline; });
        }
      }
      if (token.stop_requested()) return;

      const auto now = Clock::now();
      next_execution_ += period_;
      if (next_execution_ <= now) {
        next_execution_ += ((now - next_execution_) / period_ + 1) * period_;
      }
    }

    f();
  }
}

void Scheduler::Stop() {
  // Only the caller whose request actually stops the thread joins it.
  if (thread_.request_stop()) {
    condition_variable_.notify_one();
    if (thread_.joinable()) thread_.join();
  }
}

}  // namespace predacl::utils
