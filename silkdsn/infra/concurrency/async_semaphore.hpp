// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include <boost/asio/any_io_executor.hpp>

#include "task.hpp"

namespace silkdsn::concurrency {

/**
 * Counting semaphore for coroutines.
 *
 * Waiters are served in FIFO order and a released permit is handed over directly to the
 * oldest waiter. Once closed, pending and future acquire() calls fail with operation_canceled.
 * All member functions are thread-safe.
 */
class AsyncSemaphore {
  public:
    explicit AsyncSemaphore(size_t permits);
    ~AsyncSemaphore();

    AsyncSemaphore(const AsyncSemaphore&) = delete;
    AsyncSemaphore& operator=(const AsyncSemaphore&) = delete;

    //! Take a permit if one is immediately available
    bool try_acquire();

    //! Wait for a permit
    //! \throws boost::system::system_error with operation_canceled if the semaphore gets closed
    Task<void> acquire();

    //! Return a permit to the pool or to the oldest waiter
    void release();

    //! Wake up all waiters with a failure and refuse any further acquisition
    void close();

    size_t available_permits() const;
    size_t waiters_count() const;
    bool is_closed() const;

  private:
    struct Waiter;

    static void wake_up(const std::shared_ptr<Waiter>& waiter, bool granted);

    mutable std::mutex mutex_;
    size_t permits_;
    bool closed_{false};
    std::deque<std::shared_ptr<Waiter>> waiters_;
};

enum class PermitState {
    kFree,      // returned to the semaphore on destruction
    kConsumed,  // permanently taken out of the semaphore
};

//! RAII holder of one permit acquired from an AsyncSemaphore
class SemaphorePermit {
  public:
    //! Adopt a permit already acquired from the semaphore
    explicit SemaphorePermit(std::shared_ptr<AsyncSemaphore> semaphore);
    ~SemaphorePermit();

    SemaphorePermit(SemaphorePermit&& other) noexcept;
    SemaphorePermit& operator=(SemaphorePermit&&) = delete;
    SemaphorePermit(const SemaphorePermit&) = delete;
    SemaphorePermit& operator=(const SemaphorePermit&) = delete;

    //! Take the permit out of circulation for good: it will not be released anymore
    void consume() { state_ = PermitState::kConsumed; }

    PermitState state() const { return state_; }

  private:
    std::shared_ptr<AsyncSemaphore> semaphore_;
    PermitState state_{PermitState::kFree};
};

}  // namespace silkdsn::concurrency
