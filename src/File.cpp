#include "File.hpp"

#include "Constant.hpp"
#include "Error.hpp"
#include "Utils.hpp"

#include <filesystem>
#include <format>
#include <system_error>

namespace store::fs {

namespace {

    std::ios::openmode open_mode(File::Mode mode) {
        switch (mode) {
            case File::Mode::read:
                return std::ios::binary | std::ios::in;
            case File::Mode::truncate:
                return std::ios::binary | std::ios::out | std::ios::trunc;
        }
        return std::ios::binary | std::ios::in;
    }

}  // namespace

File::File(const std::filesystem::path& path, Mode mode) : path_{path} {
    // create directories if they don't exist
    if (mode != Mode::read && path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            err::throw_with_trace<FileError>(std::format(
                "Failed to create directories for file: {} ({})", path.string(), ec.message()
            ));
        }
    }

    file_.open(path, open_mode(mode));

    if (!file_.is_open()) {
        err::throw_with_trace<FileError>(std::format("Failed to open file: {}", path.string()));
    }
}

File::~File() {
    if (file_.is_open()) {
        file_.close();
    }
}

void File::write(std::span<const std::byte> data) {
    auto chars{utils::as_chars(data)};

    if (!file_.write(chars.data(), static_cast<std::streamsize>(chars.size()))) {
        err::throw_with_trace<FileError>(
            std::format("Failed to write to file: {}", path_.string())
        );
    }
}

std::vector<std::byte> File::read_all() {
    file_.seekg(0, std::ios::end);
    const auto size{file_.tellg()};
    if (size < 0) {
        err::throw_with_trace<FileError>(
            std::format("Failed to get the size of file: {}", path_.string())
        );
    }
    file_.seekg(0, std::ios::beg);

    std::vector<std::byte> data(static_cast<size_t>(size));
    if (!file_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
        err::throw_with_trace<FileError>(
            std::format("Failed to read from file: {}", path_.string())
        );
    }

    return data;
}

void File::close() {
    file_.flush();
    const bool failed{file_.fail()};
    file_.close();

    if (failed || file_.fail()) {
        err::throw_with_trace<FileError>(std::format("Failed to close file: {}", path_.string())
        );
    }
}

void write_file_atomically(const std::filesystem::path& path, std::span<const std::byte> data) {
    std::filesystem::path tmp_path{path};
    tmp_path += TMP_SUFFIX;

    {
        File tmp_file{tmp_path, File::Mode::truncate};
        tmp_file.write(data);
        tmp_file.close();
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        const auto reason{ec.message()};
        std::filesystem::remove(tmp_path, ec);
        err::throw_with_trace<FileError>(
            std::format("Failed to move {} into place: {}", path.string(), reason)
        );
    }
}

bool is_present(const std::filesystem::path& path, size_t length) noexcept {
    std::error_code ec;
    const auto      size{std::filesystem::file_size(path, ec)};

    return !ec && size == length;
}

}  // namespace store::fs
