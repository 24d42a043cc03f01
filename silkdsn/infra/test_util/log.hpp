// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include <silkdsn/infra/common/log.hpp>

namespace silkdsn::test_util {

//! Restores the previous log verbosity on scope exit, so tests do not depend on their execution order
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level level) : previous_level_(log::get_verbosity()) {
        log::set_verbosity(level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(previous_level_); }

  private:
    log::Level previous_level_;
};

//! Redirects std::cerr, where log lines go by default, into a buffer until destruction
class CapturedLogOutput {
  public:
    CapturedLogOutput() : cerr_buffer_(std::cerr.rdbuf(captured_.rdbuf())) {}
    ~CapturedLogOutput() { std::cerr.rdbuf(cerr_buffer_); }

    std::string str() const { return captured_.str(); }

  private:
    std::stringstream captured_;
    std::streambuf* cerr_buffer_;
};

}  // namespace silkdsn::test_util
