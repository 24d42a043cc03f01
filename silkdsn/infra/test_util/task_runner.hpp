// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>

#include <silkdsn/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace silkdsn::test_util {

//! Drives coroutines on a private io_context from the test thread, also used as a fixture base class
class TaskRunner {
  public:
    TaskRunner() = default;
    virtual ~TaskRunner() = default;

    //! Spawn the task and poll until it finishes, rethrowing its exception if any
    template <typename TResult>
    TResult run(Task<TResult> task) {
        auto future = spawn_future(std::move(task));
        poll_context_until_future_is_ready(future);
        return future.get();
    }

    //! Spawn the task without running it, progress is made by the poll functions
    template <typename TResult>
    std::future<TResult> spawn_future(Task<TResult> task) {
        return co_spawn(ioc_, std::move(task), boost::asio::use_future);
    }

    //! Poll until the future is ready, also waiting for timers to expire
    template <typename TResult>
    void poll_context_until_future_is_ready(std::future<TResult>& future) {
        using namespace std::chrono_literals;
        ioc_.restart();
        while (future.wait_for(0s) != std::future_status::ready) {
            // Timers waiting for a deadline need run_one, poll_one would spin
            if (ioc_.poll_one() == 0) {
                ioc_.run_one_for(1ms);
                ioc_.restart();
            }
        }
    }

    //! Run the ready handlers, returns when a handler would have to wait
    void poll_until_idle() {
        ioc_.restart();
        while (ioc_.poll_one() > 0) {
        }
    }

    boost::asio::io_context& ioc() { return ioc_; }
    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  protected:
    boost::asio::io_context ioc_;
};

}  // namespace silkdsn::test_util
