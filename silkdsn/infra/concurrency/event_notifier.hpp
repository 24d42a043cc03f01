// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <variant>

#include <boost/asio/any_io_executor.hpp>

#include "channel.hpp"
#include "task.hpp"

namespace silkdsn::concurrency {

//! One-shot wake-up for a single waiting coroutine, notify() may come from any thread
//! and before wait() is called
class EventNotifier {
  public:
    explicit EventNotifier(const boost::asio::any_io_executor& executor) : channel_(executor, 1) {}

    Task<void> wait() { co_await channel_.receive(); }

    void notify() {
        // A full buffer means a notification is already pending
        channel_.try_send({});
    }

  private:
    Channel<std::monostate> channel_;
};

}  // namespace silkdsn::concurrency
