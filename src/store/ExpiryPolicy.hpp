#pragma once

#include <chrono>

namespace cloudclip::store {

using Clock = std::chrono::system_clock;

// Sessions idle for longer than this are dropped by the sweep.
inline constexpr std::chrono::hours kSessionTtl{24};

// Strictly greater: a session idle for exactly kSessionTtl is still live.
inline bool is_expired(Clock::time_point last_activity, Clock::time_point now) noexcept {
    return now - last_activity > kSessionTtl;
}

} // namespace cloudclip::store
