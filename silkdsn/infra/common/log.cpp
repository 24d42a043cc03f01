// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>

#include <unistd.h>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace silkdsn::log {

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::ofstream> file_{nullptr};

static bool is_terminal(FILE* stream) { return isatty(fileno(stream)) != 0; }

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (!settings_.log_file.empty()) {
        file_ = std::make_unique<std::ofstream>(settings_.log_file, std::ios::out | std::ios::app);
        if (!file_->is_open()) {
            file_.reset();
            throw std::runtime_error("Could not open log file " + settings_.log_file);
        }
    }
    if (!is_terminal(settings_.log_std_out ? stdout : stderr)) {
        settings_.log_nocolor = true;
    }
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

static std::string_view level_tag(Level level) {
    switch (level) {
        case Level::kTrace:
            return "\x1b[90mTRACE";
        case Level::kDebug:
            return "\x1b[105mDEBUG";
        case Level::kInfo:
            return "\x1b[32m INFO";
        case Level::kWarning:
            return "\x1b[1;33m WARN";
        case Level::kError:
            return "\x1b[91mERROR";
        case Level::kCritical:
            return "\x1b[101m CRIT";
        default:
            return "     ";
    }
}

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    static const absl::TimeZone kTz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << " " << level_tag(level) << kColorReset << " "
        << kColorValue << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTz) << "] " << kColorReset;
    if (settings_.log_threads) {
        ss_ << "[" << std::this_thread::get_id() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append_message(msg);
    append_args(args);
}

void BufferBase::flush() {
    if (!should_print_) return;

    static const std::regex kEscapeSequence("\x1b\\[[0-9;]+m");
    const std::string line{ss_.str()};
    const std::string plain_line{std::regex_replace(line, kEscapeSequence, "")};

    std::scoped_lock out_lock{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << (settings_.log_nocolor ? plain_line : line) << '\n';
    if (file_) {
        *file_ << plain_line << '\n';
    }
}

}  // namespace silkdsn::log
