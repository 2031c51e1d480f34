#include "PieceLayout.hpp"

#include "Constant.hpp"
#include "Error.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <ranges>
#include <set>
#include <string>
#include <utility>

namespace store {

namespace {

    [[noreturn]] void invalid_manifest(const std::string& reason) {
        err::throw_with_trace<InvalidManifestError>(std::format("Invalid manifest: {}", reason));
    }

    void check_entry_path(const std::filesystem::path& path) {
        if (path.empty()) {
            invalid_manifest("empty file path");
        }
        if (path.has_root_path()) {
            invalid_manifest(std::format("file path {} is not relative", path.string()));
        }

        const auto normal{path.lexically_normal()};
        const auto first{*normal.begin()};
        if (first == std::filesystem::path{".."} || first == std::filesystem::path{"."} ||
            !normal.has_filename()) {
            invalid_manifest(std::format("file path {} escapes the root directory", path.string()));
        }
        if (first == std::filesystem::path{FRAGMENT_DIR}) {
            invalid_manifest(std::format(
                "file path {} uses the reserved directory {}", path.string(), FRAGMENT_DIR
            ));
        }
    }

    // Returns the total length of the files
    int64_t check_manifest(std::span<const md::ManifestEntry> manifest, int64_t piece_size) {
        if (piece_size <= 0) {
            invalid_manifest(std::format("piece size {} is not positive", piece_size));
        }
        if (manifest.empty()) {
            invalid_manifest("no files");
        }

        std::set<std::filesystem::path> seen;
        int64_t                         total{0};

        for (const auto& entry : manifest) {
            if (entry.length < 0) {
                invalid_manifest(
                    std::format("file {} has negative length {}", entry.path.string(), entry.length)
                );
            }
            check_entry_path(entry.path);

            if (!seen.insert(entry.path.lexically_normal()).second) {
                invalid_manifest(std::format("file {} is listed twice", entry.path.string()));
            }

            if (entry.length > std::numeric_limits<int64_t>::max() - total) {
                invalid_manifest(
                    std::format("total length overflows at file {}", entry.path.string())
                );
            }
            total += entry.length;
        }

        if (utils::ceil_div(total, piece_size) > std::numeric_limits<uint32_t>::max()) {
            invalid_manifest(std::format("{} bytes need too many pieces of {}", total, piece_size));
        }

        return total;
    }

    std::filesystem::path whole_fragment_path(
        const std::filesystem::path& root, size_t piece_index
    ) {
        return fragment_dir(root) / std::format("piece-{}.bin", piece_index);
    }

    std::filesystem::path split_fragment_path(
        const std::filesystem::path& root, size_t piece_index, size_t file_index
    ) {
        return fragment_dir(root) / std::format("piece-{}.file-{}.bin", piece_index, file_index);
    }

    SingleFileStructure plan_single_file(
        const md::ManifestEntry& entry, size_t piece_size, const std::filesystem::path& root
    ) {
        const auto piece_count{utils::ceil_div(static_cast<size_t>(entry.length), piece_size)};

        SingleFileStructure structure{.piece_fragments = {}, .output = root / entry.path};
        structure.piece_fragments.reserve(piece_count);

        for (auto piece_idx : std::views::iota(size_t{0}, piece_count)) {
            structure.piece_fragments.push_back(whole_fragment_path(root, piece_idx));
        }

        return structure;
    }

    MultiFileStructure plan_multi_file(
        std::span<const md::ManifestEntry> manifest,
        size_t                             piece_size,
        size_t                             total_length,
        const std::filesystem::path&       root
    ) {
        // [start, end) of every file in the flat byte stream
        std::vector<std::pair<size_t, size_t>> file_ranges;
        file_ranges.reserve(manifest.size());

        MultiFileStructure structure;
        structure.outputs.reserve(manifest.size());

        size_t offset{0};
        for (const auto& entry : manifest) {
            const auto length{static_cast<size_t>(entry.length)};
            file_ranges.emplace_back(offset, offset + length);
            structure.outputs.push_back(
                {.path = root / entry.path, .length = length, .dependencies = {}}
            );
            offset += length;
        }

        const auto piece_count{utils::ceil_div(total_length, piece_size)};
        structure.pieces.reserve(piece_count);

        // Files are visited in stream order, so the first file that can intersect the
        // current piece only moves forward
        size_t file_idx{0};

        for (auto piece_idx : std::views::iota(size_t{0}, piece_count)) {
            const size_t piece_start{piece_idx * piece_size};
            const size_t piece_end{std::min(piece_start + piece_size, total_length)};

            std::vector<FragmentSlice> slices;

            for (size_t pos{piece_start}; pos < piece_end;) {
                // skip the files that end before pos (this includes empty files)
                while (file_ranges[file_idx].second <= pos) {
                    ++file_idx;
                }

                const size_t slice_length{std::min(piece_end, file_ranges[file_idx].second) - pos};

                slices.push_back({
                    .fragment   = {},
                    .offset     = pos - piece_start,
                    .length     = slice_length,
                    .file_index = file_idx,
                });
                pos += slice_length;
            }

            if (slices.size() == 1) {
                slices.front().fragment = whole_fragment_path(root, piece_idx);
            } else {
                for (auto& slice : slices) {
                    slice.fragment = split_fragment_path(root, piece_idx, slice.file_index);
                }
            }

            // Pieces are visited in ascending order, which gives every output its fragments in
            // stream order
            for (const auto& slice : slices) {
                structure.outputs[slice.file_index].dependencies.push_back(
                    {.path = slice.fragment, .length = slice.length}
                );
            }

            if (slices.size() == 1) {
                structure.pieces.emplace_back(WholePiece{std::move(slices.front())});
            } else {
                structure.pieces.emplace_back(SplitPiece{std::move(slices)});
            }
        }

        return structure;
    }

}  // namespace

PieceLayout::PieceLayout(
    std::filesystem::path root, size_t piece_size, size_t total_length, PieceStructure structure
)
    : root_{std::move(root)},
      piece_size_{piece_size},
      total_length_{total_length},
      piece_count_{static_cast<uint32_t>(utils::ceil_div(total_length, piece_size))},
      structure_{std::move(structure)} {
    std::visit(
        utils::visitor{
            [this](const SingleFileStructure& single) {
                OutputFile output{
                    .path = single.output, .length = total_length_, .dependencies = {}
                };
                output.dependencies.reserve(single.piece_fragments.size());

                for (auto piece_idx : std::views::iota(uint32_t{0}, piece_count_)) {
                    output.dependencies.push_back(
                        {.path = single.piece_fragments[piece_idx],
                         .length = get_piece_length(piece_idx)}
                    );
                }
                outputs_.push_back(std::move(output));
            },
            [this](const MultiFileStructure& multi) { outputs_ = multi.outputs; }
        },
        structure_
    );
}

std::filesystem::path PieceLayout::get_marker_path(size_t file_index) const {
    return fragment_dir(root_) / std::format("file-{}.done", file_index);
}

std::filesystem::path PieceLayout::get_assembling_path(size_t file_index) const {
    return fragment_dir(root_) / std::format("file-{}{}", file_index, ASSEMBLING_SUFFIX);
}

PieceLayout plan_layout(
    std::span<const md::ManifestEntry> manifest,
    int64_t                            piece_size,
    const std::filesystem::path&       root
) {
    const auto total{static_cast<size_t>(check_manifest(manifest, piece_size))};

    const auto abs_root{std::filesystem::absolute(root).lexically_normal()};
    const auto size{static_cast<size_t>(piece_size)};

    PieceStructure structure;
    if (manifest.size() == 1) {
        structure = plan_single_file(manifest.front(), size, abs_root);
    } else {
        structure = plan_multi_file(manifest, size, total, abs_root);
    }

    PieceLayout layout{abs_root, size, total, std::move(structure)};

    LOG_DEBUG(
        "Planned layout in {}: {} file(s), {} bytes, {} piece(s) of {} bytes",
        abs_root.string(),
        manifest.size(),
        total,
        layout.get_piece_count(),
        size
    );

    return layout;
}

std::filesystem::path fragment_dir(const std::filesystem::path& root) {
    return root / FRAGMENT_DIR;
}

}  // namespace store
