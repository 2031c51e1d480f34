#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <string_view>

namespace store::utils {

/**
 * Calculate the ceiling of the division of the given integers
 *
 * @param divident the divident
 * @param divisor  the divisor
 * @return the ceiling of the division
 */
constexpr auto ceil_div(std::integral auto divident, std::integral auto divisor) {
    return (divident / divisor) + (divident % divisor != 0);
}

/** A visitor to use with std::visit on a variant */
template <typename... Callable>
struct visitor : Callable... {
        using Callable::operator()...;
};

/**
 * View a string as raw bytes
 *
 * @param str  the string to view
 * @return a span over the bytes of the string
 */
inline std::span<const std::byte> as_bytes(std::string_view str) {
    return std::as_bytes(std::span<const char>(str.data(), str.size()));
}

/**
 * View raw bytes as chars, as expected by the iostream API
 *
 * @param bytes  the bytes to view
 * @return a span over the same memory as chars
 */
inline std::span<const char> as_chars(std::span<const std::byte> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace store::utils
