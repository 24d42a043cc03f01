// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_condition_variable.hpp"

#include <boost/asio/this_coro.hpp>

namespace silkdsn::concurrency {

AwaitableConditionVariable::Waiter AwaitableConditionVariable::waiter() {
    std::unique_lock lock{mutex_};
    const size_t notifications_seen{notifications_};
    lock.unlock();

    return [this, notifications_seen]() -> Task<void> {
        auto executor = co_await boost::asio::this_coro::executor;

        std::list<EventNotifier>::iterator notifier;
        {
            std::scoped_lock lock{mutex_};
            if (notifications_ != notifications_seen) co_return;
            notifier = waiters_.emplace(waiters_.end(), executor);
        }

        co_await notifier->wait();

        std::scoped_lock lock{mutex_};
        waiters_.erase(notifier);
    };
}

void AwaitableConditionVariable::notify_all() {
    std::scoped_lock lock{mutex_};
    ++notifications_;
    for (auto& notifier : waiters_) {
        notifier.notify();
    }
}

}  // namespace silkdsn::concurrency
