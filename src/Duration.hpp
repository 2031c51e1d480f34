#pragma once

#include <chrono>

namespace store::duration {

inline constexpr std::chrono::milliseconds DRAIN_INTERVAL{1'000};

}  // namespace store::duration
