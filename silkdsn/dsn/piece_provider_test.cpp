// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "piece_provider.hpp"

#include <memory>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <silkdsn/infra/test_util/log.hpp>
#include <silkdsn/infra/test_util/task_runner.hpp>

#include "test_util/archived_history.hpp"
#include "test_util/fake_dsn_client.hpp"
#include "test_util/mock_piece_validator.hpp"

namespace silkdsn::dsn {

using testing::_;
using testing::InvokeWithoutArgs;

using silkdsn::test_util::SetLogVerbosityGuard;
using silkdsn::test_util::TaskRunner;
using test_util::FakeDsnClient;
using test_util::MockPieceValidator;

using ValidationResult = tl::expected<void, PieceValidationError>;

struct PieceProviderTest : public TaskRunner {
    PieceProviderTest() : client{test_util::archive_chain(test_util::make_chain(30, 4000)).segments()} {}

    SetLogVerbosityGuard log_guard{log::Level::kNone};
    FakeDsnClient client;
    std::shared_ptr<MockPieceValidator> validator{std::make_shared<MockPieceValidator>()};
};

static auto accept() {
    return InvokeWithoutArgs([]() -> Task<ValidationResult> { co_return ValidationResult{}; });
}

static auto reject() {
    return InvokeWithoutArgs([]() -> Task<ValidationResult> { co_return tl::unexpected{PieceValidationError::kInvalidPieceProof}; });
}

TEST_CASE_METHOD(PieceProviderTest, "PieceProvider.get_piece", "[silkdsn][dsn][piece_provider]") {
    PieceProvider provider{client, validator};
    const PieceIndex index{7};

    SECTION("valid piece") {
        EXPECT_CALL(*validator, validate(index, _)).WillOnce(accept());
        const auto piece{run(provider.get_piece(index, RetryPolicy::limited(0)))};
        REQUIRE(piece);
        CHECK(provider.statistics().received.load() == 1);
    }

    SECTION("invalid piece counts as a miss") {
        EXPECT_CALL(*validator, validate(index, _)).WillOnce(reject());
        CHECK_FALSE(run(provider.get_piece(index, RetryPolicy::limited(0))));
        CHECK(provider.statistics().rejected.load() == 1);
        CHECK(provider.statistics().received.load() == 0);
    }

    SECTION("network error counts as a miss") {
        client.failing_pieces.insert(index);
        EXPECT_CALL(*validator, validate(_, _)).Times(0);
        CHECK_FALSE(run(provider.get_piece(index, RetryPolicy::limited(0))));
        CHECK(provider.statistics().network_errors.load() == 1);
    }

    SECTION("piece not found") {
        client.missing_pieces.insert(index);
        CHECK_FALSE(run(provider.get_piece(index, RetryPolicy::limited(3))));
        CHECK(provider.statistics().not_found.load() == 1);
        CHECK(provider.statistics().requested.load() == 1);
    }
}

TEST_CASE_METHOD(PieceProviderTest, "PieceProvider.retry_policy", "[silkdsn][dsn][piece_provider]") {
    PeerPieceAvailability availability;
    PieceAvailabilityFilter filter{16};
    const PieceIndex index{3};
    REQUIRE(filter.insert(index));
    availability.update("peer-a", filter.export_snapshot());
    availability.update("peer-b", filter.export_snapshot());

    PieceProvider provider{client, validator, &availability};

    SECTION("no retries tries the first advertising peer only") {
        client.unreachable_peers.insert("peer-a");
        CHECK_FALSE(run(provider.get_piece(index, RetryPolicy::limited(0))));
        CHECK(client.requested_pieces().size() == 1);
        CHECK(provider.statistics().network_errors.load() == 1);
    }

    SECTION("alternates are tried after a failure") {
        client.unreachable_peers.insert("peer-a");
        EXPECT_CALL(*validator, validate(index, _)).WillOnce(reject()).WillOnce(accept());
        CHECK(run(provider.get_piece(index, RetryPolicy::limited(5))));
        // peer-a failed, peer-b sent a bad piece, the DHT delivered
        CHECK(client.requested_pieces().size() == 3);
        CHECK(provider.statistics().network_errors.load() == 1);
        CHECK(provider.statistics().rejected.load() == 1);
        CHECK(provider.statistics().received.load() == 1);
    }
}

TEST_CASE_METHOD(PieceProviderTest, "PieceProvider.without_validator", "[silkdsn][dsn][piece_provider]") {
    PieceProvider provider{client, nullptr};
    client.corrupted_pieces.insert(PieceIndex{1});
    CHECK(run(provider.get_piece(PieceIndex{1}, RetryPolicy::limited(0))));
}

}  // namespace silkdsn::dsn
