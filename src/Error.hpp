#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace err {

/**
 * @brief Get the error message with trace
 *
 * @param msg The error message
 * @return std::string The error message with trace
 */
[[nodiscard]] std::string err_msg_with_trace(const std::string& msg);

/**
 * @brief Throw an exception with trace
 *
 * @tparam Error The type of the exception
 * @param msg The error message
 */
template <typename Error = std::runtime_error>
[[noreturn]] void throw_with_trace(const std::string& msg) {
    throw Error(err_msg_with_trace(msg));
}
}  // namespace err

namespace store {

/** Errors reported per piece while writing, or per output while assembling */
enum class StorageErrc {
    invalid_piece_index = 1,
    piece_size_mismatch,
    fragment_write_failed,
    assembly_failed
};

/**
 * @brief Get the error category of the storage errors
 *
 * @return the storage error category
 */
const std::error_category& storage_category() noexcept;

inline std::error_code make_error_code(StorageErrc errc) noexcept {
    return {static_cast<int>(errc), storage_category()};
}

/** Thrown when the manifest or the piece size cannot be turned into a layout */
class InvalidManifestError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

}  // namespace store

template <>
struct std::is_error_code_enum<store::StorageErrc> : std::true_type {};
