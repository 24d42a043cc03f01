// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "segment_pieces_fetcher.hpp"

#include <exception>
#include <mutex>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>
#include <gsl/util>

#include <silkdsn/infra/common/ensure.hpp>
#include <silkdsn/infra/common/log.hpp>
#include <silkdsn/infra/concurrency/awaitable_condition_variable.hpp>

namespace silkdsn::sync {

using namespace boost::asio;
using dsn::kNumPieces;
using dsn::kNumRawRecords;
using dsn::Piece;
using dsn::PieceIndex;

//! State shared between the fetch tasks of a segment and the driver waiting for them
struct SegmentPiecesFetcher::Collector {
    explicit Collector(size_t tasks)
        : semaphore{std::make_shared<concurrency::AsyncSemaphore>(kNumRawRecords)},
          pending_tasks{tasks} {}

    //! \return true if the piece was kept
    bool add(PieceIndex piece_index, Piece piece) {
        std::scoped_lock lock{mutex};
        if (done) {
            return false;
        }
        auto& slot{pieces[piece_index.position()]};
        ensure_invariant(!slot, [&]() { return "piece " + piece_index.to_string() + " received twice"; });
        slot = std::move(piece);
        ++received;
        changed.notify_all();
        return true;
    }

    void on_complete(const std::exception_ptr& ex_ptr) {
        std::scoped_lock lock{mutex};
        --pending_tasks;
        if (ex_ptr && !exception && !done) {
            exception = ex_ptr;
        }
        changed.notify_all();
    }

    std::shared_ptr<concurrency::AsyncSemaphore> semaphore;
    std::mutex mutex;
    std::vector<std::optional<Piece>> pieces = std::vector<std::optional<Piece>>(kNumPieces);
    size_t received{0};
    size_t pending_tasks;
    bool done{false};  // results arriving afterwards are discarded
    std::exception_ptr exception;
    concurrency::AwaitableConditionVariable changed;
};

Task<std::vector<std::optional<Piece>>> SegmentPiecesFetcher::fetch(dsn::SegmentIndex segment_index) {
    auto executor = co_await this_coro::executor;

    const std::vector<PieceIndex> piece_indexes{segment_index.segment_piece_indexes_source_first()};
    auto collector = std::make_shared<Collector>(piece_indexes.size());
    // Wake up the fetches still waiting for a permit so that they quit
    [[maybe_unused]] auto _ = gsl::finally([collector] { collector->semaphore->close(); });

    SILKDSN_DEBUG << "SegmentPiecesFetcher: retrieving pieces" << log::Args{"segment", segment_index.to_string()};
    for (const PieceIndex piece_index : piece_indexes) {
        // Source pieces take their permit right away, the others wait for one in fetch_piece
        std::optional<concurrency::SemaphorePermit> permit;
        if (collector->semaphore->try_acquire()) {
            permit.emplace(collector->semaphore);
        }
        co_spawn(executor, fetch_piece(provider_, retry_policy_, collector, piece_index, std::move(permit)), [collector](const std::exception_ptr& ex_ptr) {
            collector->on_complete(ex_ptr);
        });
    }

    std::vector<std::optional<Piece>> pieces;
    size_t received{0};
    std::exception_ptr exception;
    while (true) {
        std::unique_lock lock{collector->mutex};
        if (collector->exception || collector->received >= kNumRawRecords || collector->pending_tasks == 0) {
            collector->done = true;
            pieces = std::move(collector->pieces);
            received = collector->received;
            exception = collector->exception;
            break;
        }
        auto waiter = collector->changed.waiter();
        lock.unlock();
        co_await waiter();
    }

    if (exception) {
        std::rethrow_exception(exception);
    }
    if (received >= kNumRawRecords) {
        SILKDSN_TRACE << "SegmentPiecesFetcher: received half of the segment" << log::Args{"segment", segment_index.to_string()};
    } else {
        SILKDSN_WARN << "SegmentPiecesFetcher: not enough pieces available"
                     << log::Args{"segment", segment_index.to_string(), "received", std::to_string(received)};
    }
    co_return pieces;
}

Task<void> SegmentPiecesFetcher::fetch_piece(std::shared_ptr<dsn::PieceProvider> provider,
                                             dsn::RetryPolicy retry_policy,
                                             std::shared_ptr<Collector> collector,
                                             PieceIndex piece_index,
                                             std::optional<concurrency::SemaphorePermit> permit) {
    if (!permit) {
        try {
            co_await collector->semaphore->acquire();
        } catch (const boost::system::system_error& ex) {
            if (ex.code() != boost::system::errc::operation_canceled) {
                throw;
            }
            SILKDSN_TRACE << "SegmentPiecesFetcher: semaphore closed, interrupting piece retrieval"
                          << log::Args{"piece", piece_index.to_string()};
            co_return;
        }
        permit.emplace(collector->semaphore);
    }

    std::optional<Piece> piece{co_await provider->get_piece(piece_index, retry_policy)};
    SILKDSN_TRACE << "SegmentPiecesFetcher: piece request completed"
                  << log::Args{"piece", piece_index.to_string(), "found", piece ? "true" : "false"};
    if (!piece) {
        // The permit goes back to the semaphore for another piece
        co_return;
    }

    permit->consume();
    if (!collector->add(piece_index, std::move(*piece))) {
        SILKDSN_TRACE << "SegmentPiecesFetcher: piece discarded" << log::Args{"piece", piece_index.to_string()};
    }
}

}  // namespace silkdsn::sync
