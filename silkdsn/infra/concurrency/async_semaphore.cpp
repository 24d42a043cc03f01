// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "async_semaphore.hpp"

#include <string>
#include <utility>

#include <boost/asio/this_coro.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <silkdsn/infra/common/ensure.hpp>

#include "channel.hpp"

namespace silkdsn::concurrency {

//! Receives true when a permit is handed over, false when the semaphore is closed
struct AsyncSemaphore::Waiter {
    explicit Waiter(const boost::asio::any_io_executor& executor) : outcome(executor, 1) {}

    Channel<bool> outcome;
};

static boost::system::system_error semaphore_closed_error() {
    return boost::system::system_error{make_error_code(boost::system::errc::operation_canceled), "semaphore closed"};
}

AsyncSemaphore::AsyncSemaphore(size_t permits) : permits_{permits} {}

AsyncSemaphore::~AsyncSemaphore() {
    close();
}

bool AsyncSemaphore::try_acquire() {
    std::scoped_lock lock{mutex_};
    if (closed_ || permits_ == 0 || !waiters_.empty()) {
        return false;
    }
    --permits_;
    return true;
}

Task<void> AsyncSemaphore::acquire() {
    auto executor = co_await boost::asio::this_coro::executor;

    std::shared_ptr<Waiter> waiter;
    {
        std::scoped_lock lock{mutex_};
        if (closed_) {
            throw semaphore_closed_error();
        }
        if (permits_ > 0 && waiters_.empty()) {
            --permits_;
            co_return;
        }
        waiter = std::make_shared<Waiter>(executor);
        waiters_.push_back(waiter);
    }

    // Woken up either by release() or by close()
    if (!co_await waiter->outcome.receive()) {
        throw semaphore_closed_error();
    }
}

void AsyncSemaphore::release() {
    std::shared_ptr<Waiter> waiter;
    {
        std::scoped_lock lock{mutex_};
        if (waiters_.empty()) {
            ++permits_;
            return;
        }
        waiter = std::move(waiters_.front());
        waiters_.pop_front();
    }
    wake_up(waiter, /*granted=*/true);
}

void AsyncSemaphore::close() {
    std::deque<std::shared_ptr<Waiter>> waiters;
    {
        std::scoped_lock lock{mutex_};
        closed_ = true;
        waiters.swap(waiters_);
    }
    for (const auto& waiter : waiters) {
        wake_up(waiter, /*granted=*/false);
    }
}

size_t AsyncSemaphore::available_permits() const {
    std::scoped_lock lock{mutex_};
    return permits_;
}

size_t AsyncSemaphore::waiters_count() const {
    std::scoped_lock lock{mutex_};
    return waiters_.size();
}

bool AsyncSemaphore::is_closed() const {
    std::scoped_lock lock{mutex_};
    return closed_;
}

void AsyncSemaphore::wake_up(const std::shared_ptr<Waiter>& waiter, bool granted) {
    // Each waiter is woken up once, so its single slot buffer is always free
    const bool sent{waiter->outcome.try_send(granted)};
    ensure_invariant(sent, [] { return std::string{"semaphore waiter woken up twice"}; });
}

SemaphorePermit::SemaphorePermit(std::shared_ptr<AsyncSemaphore> semaphore) : semaphore_{std::move(semaphore)} {}

SemaphorePermit::SemaphorePermit(SemaphorePermit&& other) noexcept
    : semaphore_{std::move(other.semaphore_)}, state_{other.state_} {
    other.state_ = PermitState::kConsumed;
}

SemaphorePermit::~SemaphorePermit() {
    if (semaphore_ && state_ == PermitState::kFree) {
        semaphore_->release();
    }
}

}  // namespace silkdsn::concurrency
