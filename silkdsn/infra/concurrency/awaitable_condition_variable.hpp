// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <mutex>

#include "event_notifier.hpp"
#include "task.hpp"

namespace silkdsn::concurrency {

//! \brief Wakes up every coroutine waiting on it, any number of waiters is supported
//!
//! A waiter is bound to the notification count at the time waiter() is called: a notify_all()
//! that happens between waiter() and co_await makes the waiter complete immediately.
//! Therefore call waiter() while holding the lock protecting the state you wait on:
//! \code
//!     std::unique_lock lock{mutex};
//!     while (!received_all) {
//!         auto waiter = changed.waiter();
//!         lock.unlock();
//!         co_await waiter();
//!         lock.lock();
//!     }
//! \endcode
class AwaitableConditionVariable {
  public:
    using Waiter = std::function<Task<void>()>;

    Waiter waiter();
    void notify_all();

  private:
    std::mutex mutex_;
    std::list<EventNotifier> waiters_;
    size_t notifications_{0};
};

}  // namespace silkdsn::concurrency
