#pragma once

#include "PieceLayout.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace store {

/** A verified piece, ready to be persisted */
struct CompletedPiece {
        uint32_t               index{};
        std::vector<std::byte> data;
};

struct PieceError {
        uint32_t        piece_index{};
        std::error_code error;
        std::string     message;
};

struct BatchResult {
        std::vector<uint32_t>   written;
        std::vector<PieceError> failures;

        [[nodiscard]] bool ok() const { return failures.empty(); }
};

class FragmentWriter {
    public:
        explicit FragmentWriter(std::shared_ptr<const PieceLayout> layout);

        /**
         * @brief Write every piece of a batch to its fragment file(s)
         * A piece that fails does not prevent the others from being written.
         *
         * @param pieces  the pieces to write
         * @return the indices of the written pieces and the errors of the failed ones
         */
        BatchResult write_batch(std::span<const CompletedPiece> pieces);

        /**
         * @brief Write a piece to its fragment file(s)
         * The data of a piece straddling file boundaries is cut at those boundaries and each
         * part is written to its own fragment. Parts written before a failure are kept.
         *
         * @param piece_index  the index of the piece
         * @param data         the data of the piece, of the length the layout expects
         * @return nothing on success, the reason of the failure otherwise
         */
        auto write_piece(uint32_t piece_index, std::span<const std::byte> data)
            -> std::expected<void, PieceError>;

    private:
        std::shared_ptr<const PieceLayout> layout_;
};

}  // namespace store
