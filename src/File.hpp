#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <span>
#include <stdexcept>
#include <vector>

namespace store::fs {

/** Thrown when a file cannot be opened, read or written */
class FileError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

class File {
    public:
        enum class Mode { read, truncate };

        /**
         * @brief Open the file at the given path
         *
         * @param path  the path of the file
         * @param mode  read an existing file, or create or truncate it for writing
         * @note Parent directories are created for the writing modes.
         */
        File(const std::filesystem::path& path, Mode mode);
        ~File();

        File(const File&)                = delete;
        File& operator=(const File&)     = delete;
        File(File&&) noexcept            = default;
        File& operator=(File&&) noexcept = default;

        /**
         * @brief Write data at the current end of the file
         *
         * @param data  the data to write
         */
        void write(std::span<const std::byte> data);

        /**
         * @brief Read the whole file
         *
         * @return the content of the file
         */
        std::vector<std::byte> read_all();

        /**
         * @brief Flush and close the file, reporting any pending write error
         */
        void close();

    private:
        std::fstream          file_;
        std::filesystem::path path_;
};

/**
 * @brief Replace the content of a file so that readers see either no file or the full content
 * The data is written to a temporary sibling which is then renamed over the destination.
 *
 * @param path  the destination path
 * @param data  the full content of the file
 */
void write_file_atomically(const std::filesystem::path& path, std::span<const std::byte> data);

/**
 * @brief Check that a file exists and has the expected size
 *
 * @param path    the file to check
 * @param length  the expected size in bytes
 * @return true if the file is present with exactly the given size
 */
[[nodiscard]] bool is_present(const std::filesystem::path& path, size_t length) noexcept;

}  // namespace store::fs
