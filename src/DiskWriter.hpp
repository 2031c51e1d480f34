#pragma once

#include "CompletionAssembler.hpp"
#include "Duration.hpp"
#include "FragmentWriter.hpp"
#include "PieceLayout.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace store {

/**
 * Buffers completed pieces and periodically persists them.
 *
 * Pieces are pushed from any thread with schedule(). Every drain interval the buffered pieces
 * are written to their fragments and the outputs that became complete are assembled. Drains
 * never overlap, whether they come from the periodic task or from an explicit drain() call.
 */
class DiskWriter {
    public:
        explicit DiskWriter(
            std::shared_ptr<const PieceLayout> layout,
            std::chrono::milliseconds          drain_interval = duration::DRAIN_INTERVAL
        );

        DiskWriter(const DiskWriter&)            = delete;
        DiskWriter& operator=(const DiskWriter&) = delete;
        DiskWriter(DiskWriter&&)                 = delete;
        DiskWriter& operator=(DiskWriter&&)      = delete;

        ~DiskWriter() { stop(); }

        /**
         * @brief Start draining the buffer periodically on a separate thread
         */
        void start();

        /**
         * @brief Stop the periodic drain, then drain what is left in the buffer
         * @note The writer cannot be started again once stopped
         */
        void stop();

        /**
         * @brief Add a verified piece to the buffer
         *
         * @param piece_index  the index of the piece
         * @param data         the data of the piece
         * @note This function is thread-safe
         */
        void schedule(uint32_t piece_index, std::vector<std::byte> data);

        /**
         * @brief Write the buffered pieces and assemble the outputs that became complete
         * @note This function is thread-safe
         */
        void drain();

        /**
         * @brief Get the pieces that could not be written since the last call
         * The caller is expected to fetch them again and schedule them.
         *
         * @return the indices of the failed pieces
         */
        std::vector<uint32_t> take_failed_pieces();

        /**
         * @brief Get the number of pieces waiting in the buffer
         *
         * @return the number of buffered pieces
         */
        [[nodiscard]] size_t get_buffered_count() const;

        [[nodiscard]] bool all_assembled() const { return assembler_.all_assembled(); }

    private:
        /**
         * @brief Drain the buffer every drain interval
         *
         * @note This function will run as long as the disk writer is running
         */
        asio::awaitable<void> drain_periodically();

        std::shared_ptr<const PieceLayout> layout_;
        FragmentWriter                     fragment_writer_;
        CompletionAssembler                assembler_;
        std::chrono::milliseconds          drain_interval_;

        // Pieces scheduled since the last drain
        mutable std::mutex          buffer_mutex_;
        std::vector<CompletedPiece> buffer_;

        // Serializes drains and protects failed_pieces_
        std::mutex            drain_mutex_;
        std::vector<uint32_t> failed_pieces_;

        asio::io_context                                           drain_ctx_;
        asio::executor_work_guard<asio::io_context::executor_type> drain_work_guard_{
            asio::make_work_guard(drain_ctx_)
        };

        // Run the drain context in a separate thread
        std::jthread drain_thread_;
        bool         started_{false};
        bool         stopped_{false};
};

}  // namespace store
