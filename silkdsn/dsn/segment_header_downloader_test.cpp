// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_header_downloader.hpp"

#include <cstdint>
#include <limits>

#include <catch2/catch_test_macros.hpp>

#include <silkdsn/infra/test_util/log.hpp>
#include <silkdsn/infra/test_util/task_runner.hpp>

#include "error.hpp"
#include "test_util/archived_history.hpp"
#include "test_util/fake_dsn_client.hpp"

namespace silkdsn::dsn {

using silkdsn::test_util::SetLogVerbosityGuard;
using silkdsn::test_util::TaskRunner;
using test_util::FakeDsnClient;

struct SegmentHeaderDownloaderTest : public TaskRunner {
    SegmentHeaderDownloaderTest() : history{test_util::archive_chain(test_util::make_chain(60, 4000))} {}

    SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::ArchivedHistoryBuilder history;
};

TEST_CASE_METHOD(SegmentHeaderDownloaderTest, "SegmentHeaderDownloader.get_segment_headers", "[silkdsn][dsn][segment_header_downloader]") {
    REQUIRE(history.segments().size() >= 3);
    FakeDsnClient client{history.segments()};
    SegmentHeaderDownloader downloader{client};

    SECTION("all peers honest") {
        const auto headers{run(downloader.get_segment_headers())};
        CHECK(headers == history.segment_headers());
    }

    SECTION("inconsistent peers are skipped") {
        client.lying_peers.insert("peer-a");
        client.unreachable_peers.insert("peer-b");
        const auto headers{run(downloader.get_segment_headers())};
        CHECK(headers == history.segment_headers());
    }

    SECTION("no peer supplies consistent headers") {
        client.lying_peers = {"peer-a", "peer-b", "peer-c"};
        CHECK_THROWS_AS(run(downloader.get_segment_headers()), NetworkError);
    }

    SECTION("all peers unreachable") {
        client.unreachable_peers = {"peer-a", "peer-b", "peer-c"};
        CHECK_THROWS_AS(run(downloader.get_segment_headers()), NetworkError);
    }
}

TEST_CASE_METHOD(SegmentHeaderDownloaderTest, "SegmentHeaderDownloader.out_of_range_newest_header", "[silkdsn][dsn][segment_header_downloader]") {
    FakeDsnClient client{history.segments()};
    SegmentHeaderDownloader downloader{client};

    SECTION("highest possible index") {
        client.lying_peers = {"peer-a", "peer-b", "peer-c"};
        client.advertised_tip = SegmentIndex{std::numeric_limits<uint64_t>::max()};
        CHECK_THROWS_AS(run(downloader.get_segment_headers()), NetworkError);
    }

    SECTION("index far beyond the archived history") {
        client.lying_peers = {"peer-a", "peer-b", "peer-c"};
        client.advertised_tip = SegmentIndex{uint64_t{1} << 40};
        CHECK_THROWS_AS(run(downloader.get_segment_headers()), NetworkError);
    }

    SECTION("outvoted by honest peers") {
        client.lying_peers = {"peer-a"};
        client.advertised_tip = SegmentIndex{uint64_t{1} << 40};
        CHECK(run(downloader.get_segment_headers()) == history.segment_headers());
    }
}

TEST_CASE_METHOD(SegmentHeaderDownloaderTest, "SegmentHeaderDownloader.tied_votes", "[silkdsn][dsn][segment_header_downloader]") {
    // One vote each: the higher fake tip is tried first and abandoned
    FakeDsnClient client{history.segments(), {"peer-a", "peer-b"}};
    client.lying_peers = {"peer-a"};
    client.advertised_tip = SegmentIndex{std::numeric_limits<uint64_t>::max()};
    SegmentHeaderDownloader downloader{client};
    CHECK(run(downloader.get_segment_headers()) == history.segment_headers());
}

TEST_CASE_METHOD(SegmentHeaderDownloaderTest, "SegmentHeaderDownloader.no_peers", "[silkdsn][dsn][segment_header_downloader]") {
    FakeDsnClient client{history.segments(), std::vector<PeerId>{}};
    SegmentHeaderDownloader downloader{client};
    CHECK_THROWS_AS(run(downloader.get_segment_headers()), NetworkError);
}

TEST_CASE_METHOD(SegmentHeaderDownloaderTest, "SegmentHeaderDownloader.empty_history", "[silkdsn][dsn][segment_header_downloader]") {
    FakeDsnClient client{std::vector<test_util::ArchivedSegment>{}};
    SegmentHeaderDownloader downloader{client};
    CHECK(run(downloader.get_segment_headers()).empty());
}

TEST_CASE_METHOD(SegmentHeaderDownloaderTest, "SegmentHeaderDownloader.single_segment", "[silkdsn][dsn][segment_header_downloader]") {
    FakeDsnClient client{std::vector<test_util::ArchivedSegment>{history.segments().front()}};
    SegmentHeaderDownloader downloader{client};
    const auto headers{run(downloader.get_segment_headers())};
    REQUIRE(headers.size() == 1);
    CHECK(headers[0] == history.segments().front().header);
}

}  // namespace silkdsn::dsn
