#pragma once

#include "FragmentWriter.hpp"
#include "Manifest.hpp"
#include "PieceLayout.hpp"
#include "Utils.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace test_utils {

/** The file the tests log into, instead of the default log file of the working directory */
inline std::filesystem::path log_file() {
    return std::filesystem::temp_directory_path() / "piece-store-tests.log";
}

/** A unique directory under the system temp directory, removed on destruction */
class TempDir {
    public:
        TempDir() {
            static std::atomic<uint32_t> counter{0};
            const auto stamp{std::chrono::steady_clock::now().time_since_epoch().count()};

            path_ = std::filesystem::temp_directory_path() /
                    std::format("piece-store-test-{}-{}", stamp, counter.fetch_add(1));
            std::filesystem::create_directories(path_);
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir&)            = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& path() const { return path_; }

    private:
        std::filesystem::path path_;
};

inline std::vector<std::byte> to_bytes(std::string_view str) {
    const auto bytes{store::utils::as_bytes(str)};
    return {bytes.begin(), bytes.end()};
}

/** Deterministic content where neighbouring bytes differ, so misplaced bytes are noticed */
inline std::string make_content(size_t length, uint32_t seed = 0) {
    std::string content(length, '\0');
    for (size_t i{0}; i < length; ++i) {
        content[i] = static_cast<char>('a' + (i * 7 + seed) % 26);
    }
    return content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::binary | std::ios::in};
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

/**
 * Cut the concatenated content of a transfer into the pieces the layout expects
 */
inline std::vector<store::CompletedPiece> make_pieces(
    const store::PieceLayout& layout, std::string_view content
) {
    std::vector<store::CompletedPiece> pieces;
    for (uint32_t index{0}; index < layout.get_piece_count(); ++index) {
        pieces.push_back(
            {index,
             to_bytes(content.substr(
                 index * layout.get_piece_size(), layout.get_piece_length(index)
             ))}
        );
    }
    return pieces;
}

/**
 * Get the expected content of every file of a manifest from the concatenated content
 */
inline std::vector<std::string> split_content(
    const store::md::Manifest& manifest, std::string_view content
) {
    std::vector<std::string> files;
    size_t                   offset{0};
    for (const auto& entry : manifest) {
        files.emplace_back(content.substr(offset, static_cast<size_t>(entry.length)));
        offset += static_cast<size_t>(entry.length);
    }
    return files;
}

}  // namespace test_utils
