// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace silkdsn::log {

//! \brief Severity of a log line, ordered from the least to the most verbose
enum class Level {
    kNone,  // always printed, no severity tag
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace
};

//! \brief Logging configuration, usually populated from the command line
struct Settings {
    //! Print to std::cout instead of std::cerr
    bool log_std_out{false};
    //! Timestamps in UTC rather than in the local time zone
    bool log_utc{true};
    //! Strip the ANSI colors from console output
    bool log_nocolor{false};
    //! Prefix each line with the id of the emitting thread
    bool log_threads{false};
    Level log_verbosity{Level::kInfo};
    //! When not empty, every line is also appended to this file without colors
    std::string log_file;
};

//! \brief Applies the settings to the process-wide logger
//! \note Not thread safe: call once at startup before any log line is emitted
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe: meant for startup and tests only
void set_verbosity(Level level);

//! \brief Whether a line at the given level would be printed
bool test_verbosity(Level level);

//! \brief Key/value pairs printed after the message as key=value
using Args = std::vector<std::string>;

inline constexpr std::string_view kColorReset{"\x1b[0m"};
inline constexpr std::string_view kColorKey{"\x1b[32m"};
inline constexpr std::string_view kColorValue{"\x1b[97m"};

//! \brief Accumulates one log line and prints it on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    template <class T>
    BufferBase& operator<<(const T& t) {
        if (should_print_) ss_ << t;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    void append_message(std::string_view msg) {
        if (should_print_) ss_ << std::left << std::setw(41) << std::setfill(' ') << msg;
    }
    void append_args(const Args& args) {
        if (!should_print_) return;
        for (size_t i{0}; i < args.size(); ++i) {
            if (i % 2 == 0) {
                ss_ << kColorKey << args[i] << kColorReset << "=";
            } else {
                ss_ << kColorValue << args[i] << kColorReset << " ";
            }
        }
    }
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

}  // namespace silkdsn::log

// The stream operands are not evaluated when the level is filtered out
#define SILKDSN_LOG(level_)                          \
    if (!::silkdsn::log::test_verbosity(level_)) {   \
    } else                                           \
        ::silkdsn::log::LogBuffer<level_>()

#define SILKDSN_TRACE SILKDSN_LOG(::silkdsn::log::Level::kTrace)
#define SILKDSN_DEBUG SILKDSN_LOG(::silkdsn::log::Level::kDebug)
#define SILKDSN_INFO SILKDSN_LOG(::silkdsn::log::Level::kInfo)
#define SILKDSN_WARN SILKDSN_LOG(::silkdsn::log::Level::kWarning)
#define SILKDSN_ERROR SILKDSN_LOG(::silkdsn::log::Level::kError)
