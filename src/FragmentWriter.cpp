#include "FragmentWriter.hpp"

#include "Error.hpp"
#include "File.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <format>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace store {

namespace {

    std::optional<PieceError> write_fragment(
        uint32_t piece_index, const std::filesystem::path& fragment, std::span<const std::byte> data
    ) {
        try {
            fs::write_file_atomically(fragment, data);
        } catch (const fs::FileError& e) {
            return PieceError{piece_index, StorageErrc::fragment_write_failed, e.what()};
        }

        LOG_TRACE("Wrote {} bytes of piece {} to {}", data.size(), piece_index, fragment.string());
        return std::nullopt;
    }

}  // namespace

FragmentWriter::FragmentWriter(std::shared_ptr<const PieceLayout> layout)
    : layout_{std::move(layout)} {
    if (!layout_) {
        err::throw_with_trace<std::invalid_argument>("FragmentWriter requires a layout");
    }
}

BatchResult FragmentWriter::write_batch(std::span<const CompletedPiece> pieces) {
    BatchResult result;

    for (const auto& piece : pieces) {
        auto written = write_piece(piece.index, piece.data);

        if (written) {
            result.written.push_back(piece.index);
        } else {
            LOG_WARN("Piece {} was not written: {}", piece.index, written.error().message);
            result.failures.push_back(std::move(written.error()));
        }
    }

    LOG_DEBUG(
        "Wrote batch of {} piece(s): {} failure(s)", pieces.size(), result.failures.size()
    );

    return result;
}

auto FragmentWriter::write_piece(uint32_t piece_index, std::span<const std::byte> data)
    -> std::expected<void, PieceError> {
    if (piece_index >= layout_->get_piece_count()) {
        return std::unexpected(PieceError{
            piece_index,
            StorageErrc::invalid_piece_index,
            std::format("piece {} is out of range [0, {})", piece_index, layout_->get_piece_count())
        });
    }

    const auto expected_length{layout_->get_piece_length(piece_index)};
    if (data.size() != expected_length) {
        return std::unexpected(PieceError{
            piece_index,
            StorageErrc::piece_size_mismatch,
            std::format(
                "piece {} has {} bytes, expected {}", piece_index, data.size(), expected_length
            )
        });
    }

    std::optional<PieceError> error;

    std::visit(
        utils::visitor{
            [&](const SingleFileStructure& single) {
                error = write_fragment(piece_index, single.piece_fragments[piece_index], data);
            },
            [&](const MultiFileStructure& multi) {
                std::visit(
                    utils::visitor{
                        [&](const WholePiece& whole) {
                            error = write_fragment(piece_index, whole.slice.fragment, data);
                        },
                        [&](const SplitPiece& split) {
                            // every slice is attempted, the first failure is reported
                            for (const auto& slice : split.slices) {
                                auto slice_error = write_fragment(
                                    piece_index,
                                    slice.fragment,
                                    data.subspan(slice.offset, slice.length)
                                );
                                if (slice_error && !error) {
                                    error = std::move(slice_error);
                                }
                            }
                        }
                    },
                    multi.pieces[piece_index]
                );
            }
        },
        layout_->get_structure()
    );

    if (error) {
        return std::unexpected(std::move(*error));
    }
    return {};
}

}  // namespace store
