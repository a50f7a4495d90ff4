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

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace predacl::utils {

/**
 * Runs a function periodically on its own thread.
 *
 * The first execution happens one period after `Run`. Executions never
 * overlap; when the function runs longer than the period, the next execution
 * starts right after it and missed periods are skipped.
 */
class Scheduler {
 public:
  using Clock = std::chrono::steady_clock;

  Scheduler() = default;

  Scheduler(const Scheduler &) = delete;
  Scheduler(Scheduler &&) = delete;
  Scheduler &operator=(const Scheduler &) = delete;
  Scheduler &operator=(Scheduler &&) = delete;

  ~Scheduler() { Stop(); }

  /// Stops a previously started function, then starts `f`.
  /// @throw std::system_error if the thread could not be started.
  void Run(const std::string &service_name, const std::function<void()> &f);

  /// A non-positive period suspends executions until a positive one is set.
  /// Takes effect immediately, also on a running scheduler.
  void SetInterval(std::chrono::milliseconds period);

  template <typename TRep, typename TPeriod>
  void SetInterval(const std::chrono::duration<TRep, TPeriod> &period) {
    SetInterval(std::chrono::duration_cast<std::chrono::milliseconds>(period));
  }

  void Stop();

  bool IsRunning() const;

 private:
  void ThreadRun(std::string service_name, std::function<void()> f, std::stop_token token);

  std::mutex mutex_;
  std::condition_variable_any condition_variable_;
  std::chrono::milliseconds period_{0};
  Clock::time_point next_execution_{Clock::time_point::max()};
  std::jthread thread_;
};

}  // namespace predacl::utils
