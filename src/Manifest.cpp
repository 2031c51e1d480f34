#include "Manifest.hpp"

#include "Error.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <limits>
#include <numeric>
#include <sstream>
#include <string>
#include <string_view>

namespace {

constexpr std::string_view WHITESPACE{" \t\r"};

std::string_view trim(std::string_view str) {
    const auto first{str.find_first_not_of(WHITESPACE)};
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last{str.find_last_not_of(WHITESPACE)};
    return str.substr(first, last - first + 1);
}

store::md::ManifestEntry parse_line(std::string_view line, size_t line_no) {
    const auto separator{line.find_first_of(WHITESPACE)};
    if (separator == std::string_view::npos) {
        err::throw_with_trace<store::InvalidManifestError>(
            std::format("Invalid manifest: line {} has no path", line_no)
        );
    }

    const std::string_view length_str{line.substr(0, separator)};
    const std::string_view path_str{trim(line.substr(separator))};

    int64_t length{};
    auto [ptr, ec] =
        std::from_chars(length_str.data(), length_str.data() + length_str.size(), length);
    if (ec != std::errc{} || ptr != length_str.data() + length_str.size()) {
        err::throw_with_trace<store::InvalidManifestError>(
            std::format(
                "Invalid manifest: line {} has an invalid length \"{}\"", line_no, length_str
            )
        );
    }

    return {std::filesystem::path{path_str}, length};
}

}  // namespace

namespace store::md {

Manifest parse_manifest(std::istream& manifest_istream) {
    Manifest    manifest;
    std::string line;
    size_t      line_no{0};

    while (std::getline(manifest_istream, line)) {
        ++line_no;
        const auto content{trim(line)};
        if (content.empty() || content.front() == '#') {
            continue;
        }
        manifest.push_back(parse_line(content, line_no));
    }

    return manifest;
}

Manifest parse_manifest(const std::string& manifest_str) {
    std::istringstream manifest_istream{manifest_str};
    return parse_manifest(manifest_istream);
}

Manifest parse_manifest_file(const std::filesystem::path& manifest_path) {
    std::ifstream manifest_istream(manifest_path, std::ios::in);

    if (!manifest_istream.is_open()) {
        err::throw_with_trace(std::format("Failed to open manifest: {}", manifest_path.string()));
    }

    return parse_manifest(manifest_istream);
}

int64_t total_length(std::span<const ManifestEntry> manifest) {
    return std::accumulate(
        manifest.begin(),
        manifest.end(),
        int64_t{0},
        [](int64_t acc, const ManifestEntry& entry) {
            if ((entry.length > 0 && acc > std::numeric_limits<int64_t>::max() - entry.length) ||
                (entry.length < 0 && acc < std::numeric_limits<int64_t>::min() - entry.length)) {
                err::throw_with_trace<InvalidManifestError>(std::format(
                    "Invalid manifest: total length overflows at {}", entry.path.string()
                ));
            }
            return acc + entry.length;
        }
    );
}

}  // namespace store::md
