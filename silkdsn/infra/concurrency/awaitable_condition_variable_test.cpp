// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_condition_variable.hpp"

#include <chrono>
#include <future>
#include <mutex>
#include <thread>

#include <catch2/catch_test_macros.hpp>

#include <silkdsn/infra/test_util/task_runner.hpp>

namespace silkdsn::concurrency {

using namespace std::chrono_literals;

TEST_CASE("AwaitableConditionVariable.notified_before_await", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    AwaitableConditionVariable changed;
    auto waiter = changed.waiter();

    changed.notify_all();
    runner.run(waiter());
}

TEST_CASE("AwaitableConditionVariable.waits_for_notification", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    AwaitableConditionVariable changed;
    auto first = changed.waiter();
    auto second = changed.waiter();

    auto first_future = runner.spawn_future(first());
    auto second_future = runner.spawn_future(second());
    runner.poll_until_idle();
    CHECK(first_future.wait_for(0s) == std::future_status::timeout);
    CHECK(second_future.wait_for(0s) == std::future_status::timeout);

    changed.notify_all();
    runner.poll_context_until_future_is_ready(first_future);
    runner.poll_context_until_future_is_ready(second_future);
}

TEST_CASE("AwaitableConditionVariable.waiter_created_after_notification", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    AwaitableConditionVariable changed;
    changed.notify_all();

    auto waiter = changed.waiter();
    auto future = runner.spawn_future(waiter());
    runner.poll_until_idle();
    CHECK(future.wait_for(0s) == std::future_status::timeout);

    changed.notify_all();
    runner.poll_context_until_future_is_ready(future);
}

TEST_CASE("AwaitableConditionVariable.producer_thread", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    AwaitableConditionVariable changed;
    std::mutex mutex;
    int received{0};

    auto consumer = [&]() -> Task<int> {
        std::unique_lock lock{mutex};
        while (received < 3) {
            auto waiter = changed.waiter();
            lock.unlock();
            co_await waiter();
            lock.lock();
        }
        co_return received;
    };
    auto future = runner.spawn_future(consumer());
    runner.poll_until_idle();

    std::thread producer{[&]() {
        for (int i{0}; i < 3; ++i) {
            std::scoped_lock lock{mutex};
            ++received;
            changed.notify_all();
        }
    }};
    runner.poll_context_until_future_is_ready(future);
    producer.join();
    CHECK(future.get() == 3);
}

}  // namespace silkdsn::concurrency
