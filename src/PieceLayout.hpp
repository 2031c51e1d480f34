#pragma once

#include "Manifest.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <variant>
#include <vector>

namespace store {

/** The part of a piece that lands in one fragment file */
struct FragmentSlice {
        std::filesystem::path fragment;
        // offset of the slice inside the piece
        size_t offset{};
        size_t length{};
        // index of the output file (in manifest order) the slice belongs to
        size_t file_index{};
};

/** The whole piece belongs to one fragment file */
struct WholePiece {
        FragmentSlice slice;
};

/**
 * The piece straddles file boundaries. The slices are ordered by offset, cover the piece
 * contiguously and there are at least two of them.
 */
struct SplitPiece {
        std::vector<FragmentSlice> slices;
};

using PieceSplit = std::variant<WholePiece, SplitPiece>;

/** Layout of a transfer made of one file: one fragment per piece */
struct SingleFileStructure {
        std::vector<std::filesystem::path> piece_fragments;
        std::filesystem::path              output;
};

/** A fragment an output file depends on */
struct Fragment {
        std::filesystem::path path;
        size_t                length{};
};

/** An output file and the ordered fragments it is concatenated from */
struct OutputFile {
        std::filesystem::path path;
        size_t                length{};
        std::vector<Fragment> dependencies;
};

/** Layout of a transfer made of several files */
struct MultiFileStructure {
        std::vector<PieceSplit> pieces;
        std::vector<OutputFile> outputs;
};

using PieceStructure = std::variant<SingleFileStructure, MultiFileStructure>;

class PieceLayout {
    public:
        PieceLayout(
            std::filesystem::path root,
            size_t                piece_size,
            size_t                total_length,
            PieceStructure        structure
        );

        /**
         * @brief Get the number of pieces of the transfer
         *
         * @return the number of pieces
         */
        [[nodiscard]] uint32_t get_piece_count() const { return piece_count_; }

        /**
         * @brief Get the expected length of a piece
         *
         * @param piece_index  the index of the piece, must be less than the piece count
         * @return the piece size, or the remainder of the transfer for the last piece
         */
        [[nodiscard]] size_t get_piece_length(uint32_t piece_index) const {
            return piece_index == piece_count_ - 1 ? 1 + (total_length_ - 1) % piece_size_
                                                   : piece_size_;
        }

        /**
         * @brief Get the output files with the fragments they are assembled from
         *
         * @return the output files in manifest order
         * @note For a single file transfer this holds one output depending on every piece
         */
        [[nodiscard]] std::span<const OutputFile> get_outputs() const { return outputs_; }

        /**
         * @brief Get the path of the file marking an output as assembled
         *
         * @param file_index  the index of the output file
         * @return the path of the marker
         */
        [[nodiscard]] std::filesystem::path get_marker_path(size_t file_index) const;

        /**
         * @brief Get the path of the temporary file an output is assembled into
         *
         * @param file_index  the index of the output file
         * @return a path inside the fragment directory, so it never names another output
         */
        [[nodiscard]] std::filesystem::path get_assembling_path(size_t file_index) const;

        [[nodiscard]] const std::filesystem::path& get_root() const { return root_; }
        [[nodiscard]] size_t get_piece_size() const { return piece_size_; }
        [[nodiscard]] size_t get_total_length() const { return total_length_; }
        [[nodiscard]] const PieceStructure& get_structure() const { return structure_; }

    private:
        std::filesystem::path   root_;
        size_t                  piece_size_;
        size_t                  total_length_;
        uint32_t                piece_count_;
        PieceStructure          structure_;
        std::vector<OutputFile> outputs_;
};

/**
 * @brief Plan where the bytes of every piece of a transfer land on disk
 *
 * @param manifest    the output files of the transfer, in stream order
 * @param piece_size  the size of every piece but the last one
 * @param root        the directory the outputs and the fragments are created in
 * @return the layout of the transfer
 * @throws InvalidManifestError if the manifest is empty or malformed or the piece size is not
 * positive
 */
PieceLayout plan_layout(
    std::span<const md::ManifestEntry> manifest,
    int64_t                            piece_size,
    const std::filesystem::path&       root
);

/**
 * @brief Get the directory holding the fragment files of a root directory
 *
 * @param root  the root directory of the transfer
 * @return the fragment directory
 */
[[nodiscard]] std::filesystem::path fragment_dir(const std::filesystem::path& root);

}  // namespace store
