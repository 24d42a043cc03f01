// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include "task.hpp"

namespace silkdsn::concurrency {

//! Thread-safe buffered channel delivering values to coroutines
template <typename T>
class Channel {
  public:
    Channel(const boost::asio::any_io_executor& executor, size_t max_buffer_size)
        : channel_(executor, max_buffer_size) {}

    //! \return false if the buffer is full and no receiver is waiting
    bool try_send(T value) {
        return channel_.try_send(boost::system::error_code(), std::move(value));
    }

    //! \throws boost::system::system_error with operation_canceled if the channel gets closed
    Task<T> receive() {
        try {
            co_return (co_await channel_.async_receive(boost::asio::use_awaitable));
        } catch (const boost::system::system_error& ex) {
            if (ex.code() == boost::asio::experimental::error::channel_cancelled ||
                ex.code() == boost::asio::experimental::error::channel_closed) {
                throw boost::system::system_error(make_error_code(boost::system::errc::operation_canceled));
            }
            throw;
        }
    }

    void close() { channel_.close(); }

  private:
    boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
};

}  // namespace silkdsn::concurrency
