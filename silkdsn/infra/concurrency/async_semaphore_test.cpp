// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "async_semaphore.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>

#include <silkdsn/infra/test_util/task_runner.hpp>

namespace silkdsn::concurrency {

using namespace std::chrono_literals;

TEST_CASE("AsyncSemaphore.try_acquire", "[silkdsn][infra][concurrency]") {
    AsyncSemaphore semaphore{2};
    CHECK(semaphore.try_acquire());
    CHECK(semaphore.try_acquire());
    CHECK_FALSE(semaphore.try_acquire());
    CHECK(semaphore.available_permits() == 0);

    semaphore.release();
    CHECK(semaphore.available_permits() == 1);
    CHECK(semaphore.try_acquire());
}

TEST_CASE("AsyncSemaphore.acquire_without_waiting", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    AsyncSemaphore semaphore{1};
    runner.run(semaphore.acquire());
    CHECK(semaphore.available_permits() == 0);
}

TEST_CASE("AsyncSemaphore.release_hands_permit_to_waiter", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    AsyncSemaphore semaphore{1};
    REQUIRE(semaphore.try_acquire());

    auto future = runner.spawn_future(semaphore.acquire());
    runner.poll_until_idle();
    CHECK(future.wait_for(0s) == std::future_status::timeout);
    CHECK(semaphore.waiters_count() == 1);

    // A pending waiter takes precedence over try_acquire
    semaphore.release();
    CHECK_FALSE(semaphore.try_acquire());
    runner.poll_context_until_future_is_ready(future);
    CHECK_NOTHROW(future.get());
    CHECK(semaphore.available_permits() == 0);
    CHECK(semaphore.waiters_count() == 0);
}

TEST_CASE("AsyncSemaphore.close_fails_waiters", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    AsyncSemaphore semaphore{0};

    auto future1 = runner.spawn_future(semaphore.acquire());
    auto future2 = runner.spawn_future(semaphore.acquire());
    runner.poll_until_idle();

    semaphore.close();
    runner.poll_context_until_future_is_ready(future1);
    runner.poll_context_until_future_is_ready(future2);
    CHECK_THROWS_AS(future1.get(), boost::system::system_error);
    CHECK_THROWS_AS(future2.get(), boost::system::system_error);

    CHECK(semaphore.is_closed());
    CHECK_FALSE(semaphore.try_acquire());
    CHECK_THROWS_AS(runner.run(semaphore.acquire()), boost::system::system_error);
}

TEST_CASE("AsyncSemaphore.release_from_another_thread", "[silkdsn][infra][concurrency]") {
    test_util::TaskRunner runner;
    AsyncSemaphore semaphore{0};
    auto future = runner.spawn_future(semaphore.acquire());
    runner.poll_until_idle();
    REQUIRE(semaphore.waiters_count() == 1);

    std::thread releasing_thread{[&]() { semaphore.release(); }};
    releasing_thread.join();
    runner.poll_context_until_future_is_ready(future);
    CHECK_NOTHROW(future.get());
    CHECK(semaphore.available_permits() == 0);
}

TEST_CASE("SemaphorePermit", "[silkdsn][infra][concurrency]") {
    auto semaphore = std::make_shared<AsyncSemaphore>(1);
    REQUIRE(semaphore->try_acquire());

    SECTION("free permit returns to the pool") {
        {
            SemaphorePermit permit{semaphore};
            CHECK(permit.state() == PermitState::kFree);
        }
        CHECK(semaphore->available_permits() == 1);
    }

    SECTION("consumed permit is gone for good") {
        {
            SemaphorePermit permit{semaphore};
            permit.consume();
            CHECK(permit.state() == PermitState::kConsumed);
        }
        CHECK(semaphore->available_permits() == 0);
    }

    SECTION("moved permit is released once") {
        {
            SemaphorePermit permit{semaphore};
            SemaphorePermit moved{std::move(permit)};
            CHECK(moved.state() == PermitState::kFree);
        }
        CHECK(semaphore->available_permits() == 1);
    }
}

}  // namespace silkdsn::concurrency
