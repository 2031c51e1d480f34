#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <vector>

namespace store::md {

struct ManifestEntry {
        std::filesystem::path path;
        int64_t               length{};
};

using Manifest = std::vector<ManifestEntry>;

/**
 * @brief Parse a manifest in text form
 * Each non-empty line holds "<length> <relative path>"; lines starting with '#' are comments.
 *
 * @param manifest_istream  the input stream of the manifest
 * @return the parsed manifest, in file order
 * @throws InvalidManifestError if a line is malformed
 */
Manifest parse_manifest(std::istream& manifest_istream);

/**
 * @brief Parse a manifest in text form
 *
 * @param manifest_str  the string representation of the manifest
 * @return the parsed manifest, in file order
 */
Manifest parse_manifest(const std::string& manifest_str);

/**
 * @brief Parse the manifest file at the given path
 *
 * @param manifest_path  the path of the manifest file
 * @return the parsed manifest, in file order
 */
Manifest parse_manifest_file(const std::filesystem::path& manifest_path);

/**
 * @brief Get the total length of the transfer described by a manifest
 *
 * @param manifest  the manifest
 * @return the sum of the file lengths
 * @throws InvalidManifestError if the sum does not fit in 64 bits
 */
[[nodiscard]] int64_t total_length(std::span<const ManifestEntry> manifest);

}  // namespace store::md
