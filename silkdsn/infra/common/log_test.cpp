// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <absl/strings/match.h>
#include <catch2/catch_test_macros.hpp>

#include <silkdsn/infra/test_util/log.hpp>

namespace silkdsn::log {

//! Custom LogBuffer just for testing to access buffered content
template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    explicit LogBufferForTest() : LogBuffer<level>() {}
    explicit LogBufferForTest(std::string_view msg, const Args& args) : LogBuffer<level>(msg, args) {}

    std::string content() const { return LogBuffer<level>::ss_.str(); }
};

template <Level level>
static bool log_stores_content() {
    LogBufferForTest<level> log_buffer;
    log_buffer << "test";
    return absl::StrContains(log_buffer.content(), "test");
}

TEST_CASE("LogBuffer", "[silkdsn][infra][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    test_util::CapturedLogOutput captured;
    init(Settings{.log_nocolor = true, .log_verbosity = Level::kInfo});

    SECTION("verbosity filtering") {
        CHECK_FALSE(log_stores_content<Level::kTrace>());
        CHECK_FALSE(log_stores_content<Level::kDebug>());
        CHECK(log_stores_content<Level::kInfo>());
        CHECK(log_stores_content<Level::kWarning>());
        CHECK(log_stores_content<Level::kCritical>());

        test_util::SetLogVerbosityGuard guard{Level::kWarning};
        CHECK_FALSE(log_stores_content<Level::kInfo>());
        CHECK(log_stores_content<Level::kError>());
    }

    SECTION("key value arguments") {
        LogBufferForTest<Level::kInfo> log_buffer{"DsnSync: segment imported", {"segment", "3", "blocks", "17"}};
        CHECK(absl::StrContains(log_buffer.content(), "DsnSync: segment imported"));
        CHECK(absl::StrContains(log_buffer.content(), "segment"));
        CHECK(absl::StrContains(log_buffer.content(), "17"));
    }

    SECTION("flush strips colors when disabled") {
        { LogBufferForTest<Level::kWarning>{"piece rejected", {"index", "42"}}; }
        const auto output{captured.str()};
        CHECK(absl::StrContains(output, "piece rejected"));
        CHECK(absl::StrContains(output, "index=42"));
        CHECK_FALSE(absl::StrContains(output, "\x1b["));
    }

    SECTION("macros skip disabled levels") {
        SILKDSN_TRACE << "invisible";
        SILKDSN_INFO << "visible";
        const auto output{captured.str()};
        CHECK_FALSE(absl::StrContains(output, "invisible"));
        CHECK(absl::StrContains(output, "visible"));
    }

    SECTION("lines are appended to the log file without colors") {
        const auto log_file{std::filesystem::temp_directory_path() / "silkdsn_log_test.log"};
        std::filesystem::remove(log_file);
        init(Settings{.log_verbosity = Level::kInfo, .log_file = log_file.string()});
        SILKDSN_WARN << "segment skipped" << Args{"segment", "7"};
        init(Settings{.log_nocolor = true, .log_verbosity = Level::kInfo});

        std::ifstream in{log_file};
        const std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        CHECK(absl::StrContains(content, "segment skipped"));
        CHECK(absl::StrContains(content, "segment=7"));
        CHECK_FALSE(absl::StrContains(content, "\x1b["));
        std::filesystem::remove(log_file);
    }

    SECTION("unwritable log file") {
        const auto log_file{std::filesystem::temp_directory_path() / "silkdsn_missing_dir" / "out.log"};
        CHECK_THROWS_AS(init(Settings{.log_file = log_file.string()}), std::runtime_error);
        init(Settings{.log_nocolor = true, .log_verbosity = Level::kInfo});
    }
}

}  // namespace silkdsn::log
