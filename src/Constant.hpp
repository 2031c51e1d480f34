#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace store {

// Directory (relative to the root) holding fragment files and assembly markers
inline constexpr std::string_view FRAGMENT_DIR{".pieces"};

// Suffix of the temporary file an output is assembled into before the final rename
inline constexpr std::string_view ASSEMBLING_SUFFIX{".assembling"};

// Suffix of the temporary file a fragment is written into before the final rename
inline constexpr std::string_view TMP_SUFFIX{".tmp"};

inline constexpr uint32_t DEFAULT_PIECE_SIZE{1U << 18U};

}  // namespace store
