// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "channel.hpp"

#include <chrono>
#include <future>
#include <thread>

#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>

#include <silkdsn/infra/test_util/task_runner.hpp>

#include "event_notifier.hpp"

namespace silkdsn::concurrency {

using namespace std::chrono_literals;

TEST_CASE("Channel.buffered_value", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    Channel<int> channel{runner.executor(), 1};
    CHECK(channel.try_send(7));
    CHECK_FALSE(channel.try_send(8));
    CHECK(runner.run(channel.receive()) == 7);
}

TEST_CASE("Channel.close_and_receive", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    Channel<int> channel{runner.executor(), 1};
    auto future = runner.spawn_future(channel.receive());
    runner.poll_until_idle();

    channel.close();
    runner.poll_context_until_future_is_ready(future);
    try {
        future.get();
        FAIL("expected system_error");
    } catch (const boost::system::system_error& ex) {
        CHECK(ex.code() == boost::system::errc::operation_canceled);
    }
}

TEST_CASE("EventNotifier.notify_before_wait", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    EventNotifier notifier{runner.executor()};
    notifier.notify();
    notifier.notify();
    runner.run(notifier.wait());
}

TEST_CASE("EventNotifier.notify_from_another_thread", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    EventNotifier notifier{runner.executor()};
    auto future = runner.spawn_future(notifier.wait());
    runner.poll_until_idle();
    CHECK(future.wait_for(0s) == std::future_status::timeout);

    std::thread notifying_thread{[&]() { notifier.notify(); }};
    notifying_thread.join();
    runner.poll_context_until_future_is_ready(future);
}

}  // namespace silkdsn::concurrency
