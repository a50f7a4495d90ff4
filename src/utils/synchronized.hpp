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

#include <concepts>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace predacl::utils {

template <typename TMutex>
concept SharedMutex = requires(TMutex mutex) {
  mutex.lock();
  mutex.unlock();
  mutex.lock_shared();
  mutex.unlock_shared();
};

/// Binds an object to the mutex that guards it, so the object can only be
/// reached while the mutex is held:
///
///  1. Acquiring a locked pointer:
///     auto users = synched_users.Lock();
///     users->emplace(name, user);
///
///  2. Using the indirection operator for one-line operations:
///     synched_users->emplace(name, user);
///
///  3. Using a lambda for multi-line operations:
///     synched_users.WithLock([&](auto &users) { ... });
///
/// With a shared mutex, `ReadLock`/`WithReadLock` and the const indirection
/// operator take the lock in shared mode.
template <class T, class TMutex = std::mutex>
class Synchronized {
 public:
  template <class... Args>
  explicit Synchronized(Args &&...args) : object_(std::forward<Args>(args)...) {}

  Synchronized(const Synchronized &) = delete;
  Synchronized(Synchronized &&) = delete;
  Synchronized &operator=(const Synchronized &) = delete;
  Synchronized &operator=(Synchronized &&) = delete;
  ~Synchronized() = default;

  class LockedPtr {
   private:
    friend class Synchronized<T, TMutex>;

    LockedPtr(T *object_ptr, TMutex *mutex) : object_ptr_(object_ptr), guard_(*mutex) {}

   public:
    T *operator->() { return object_ptr_; }
    T &operator*() { return *object_ptr_; }

   private:
    T *object_ptr_;
    std::lock_guard<TMutex> guard_;
  };

  class ReadLockedPtr {
   private:
    friend class Synchronized<T, TMutex>;

    ReadLockedPtr(const T *object_ptr, TMutex *mutex) : object_ptr_(object_ptr), guard_(*mutex) {}

   public:
    const T *operator->() const { return object_ptr_; }
    const T &operator*() const { return *object_ptr_; }

   private:
    const T *object_ptr_;
    std::shared_lock<TMutex> guard_;
  };

  LockedPtr Lock() { return LockedPtr(&object_, &mutex_); }

  template <class TCallable>
  decltype(auto) WithLock(TCallable &&callable) {
    return callable(*Lock());
  }

  LockedPtr operator->() { return LockedPtr(&object_, &mutex_); }

  template <typename = void>
  requires SharedMutex<TMutex> ReadLockedPtr ReadLock() const { return ReadLockedPtr(&object_, &mutex_); }

  template <class TCallable>
  requires SharedMutex<TMutex> decltype(auto) WithReadLock(TCallable &&callable) const {
    return callable(*ReadLock());
  }

  template <typename = void>
  requires SharedMutex<TMutex> ReadLockedPtr operator->() const { return ReadLockedPtr(&object_, &mutex_); }

 private:
  T object_;
  mutable TMutex mutex_;
};

}  // namespace predacl::utils
