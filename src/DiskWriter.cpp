#include "DiskWriter.hpp"

#include "Error.hpp"
#include "Logger.hpp"

#include <asio/experimental/as_tuple.hpp>
#include <stdexcept>
#include <utility>

using asio::awaitable;
using asio::co_spawn;
namespace this_coro = asio::this_coro;

// Use the nothrow awaitable completion token to avoid exceptions
constexpr auto use_nothrow_awaitable = asio::experimental::as_tuple(asio::use_awaitable);

namespace store {

DiskWriter::DiskWriter(
    std::shared_ptr<const PieceLayout> layout, std::chrono::milliseconds drain_interval
)
    : layout_{std::move(layout)},
      fragment_writer_{layout_},
      assembler_{layout_},
      drain_interval_{drain_interval} {
    if (drain_interval_ <= std::chrono::milliseconds::zero()) {
        err::throw_with_trace<std::invalid_argument>("Drain interval must be positive");
    }
}

void DiskWriter::start() {
    if (started_ || stopped_) {
        return;
    }
    // Run the drain context
    drain_thread_ = std::jthread([this] { drain_ctx_.run(); });
    // Start the periodic drain task
    co_spawn(drain_ctx_, drain_periodically(), asio::detached);

    started_ = true;
    LOG_DEBUG("Disk writer started, draining every {} ms", drain_interval_.count());
}

void DiskWriter::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    if (started_) {
        // Reset the work guard and stop the context
        drain_work_guard_.reset();
        drain_ctx_.stop();
        if (drain_thread_.joinable()) {
            drain_thread_.join();
        }
    }

    // Persist whatever was scheduled after the last periodic drain
    drain();
    LOG_DEBUG("Disk writer stopped");
}

void DiskWriter::schedule(uint32_t piece_index, std::vector<std::byte> data) {
    std::scoped_lock lock(buffer_mutex_);
    buffer_.push_back({piece_index, std::move(data)});
}

void DiskWriter::drain() {
    std::scoped_lock drain_lock(drain_mutex_);

    std::vector<CompletedPiece> batch;
    {
        std::scoped_lock lock(buffer_mutex_);
        batch.swap(buffer_);
    }

    if (!batch.empty()) {
        auto written{fragment_writer_.write_batch(batch)};

        for (const auto& failure : written.failures) {
            failed_pieces_.push_back(failure.piece_index);
        }
    }

    // Also runs for an empty batch: a previous promotion may have failed
    if (!assembler_.all_assembled()) {
        auto promoted{assembler_.promote_completed()};

        if (!promoted.assembled.empty()) {
            LOG_INFO("Assembled {} output file(s)", promoted.assembled.size());
        }
        if (assembler_.all_assembled()) {
            LOG_INFO("All output files are assembled");
        }
    }
}

std::vector<uint32_t> DiskWriter::take_failed_pieces() {
    std::scoped_lock lock(drain_mutex_);
    return std::exchange(failed_pieces_, {});
}

size_t DiskWriter::get_buffered_count() const {
    std::scoped_lock lock(buffer_mutex_);
    return buffer_.size();
}

awaitable<void> DiskWriter::drain_periodically() {
    asio::steady_timer timer(co_await this_coro::executor);

    while (true) {
        timer.expires_after(drain_interval_);
        auto [ec] = co_await timer.async_wait(use_nothrow_awaitable);
        if (ec == asio::error::operation_aborted) {
            co_return;
        }

        drain();
    }
}

}  // namespace store
