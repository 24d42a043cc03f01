// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <coroutine>

#include <boost/asio/awaitable.hpp>

// Declared directly in silkdsn so that every layer can write Task<T> unqualified
namespace silkdsn {

//! Coroutine result type used by all asynchronous operations, runs on a Boost.Asio executor
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace silkdsn
