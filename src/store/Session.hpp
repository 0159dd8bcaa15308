#pragma once

#include "store/ExpiryPolicy.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace cloudclip::store {

inline constexpr std::size_t kMaxItemsPerSession = 10;
inline constexpr const char* kUnknownHostname = "unknown";

struct ClipboardItem {
    std::string id;        // "clip_<session_id>_<seq>"
    std::string content;
    Clock::time_point timestamp{};
    std::string hostname;
};

struct Session {
    std::string session_id;

    Clock::time_point created_at{};
    Clock::time_point last_activity{};

    std::vector<std::string> hostnames;  // insertion order, no duplicates
    std::deque<ClipboardItem> items;     // oldest first

    // Sequence number of the last item ever added; survives trimming so ids
    // are never handed out twice within a session.
    std::uint64_t last_sequence = 0;

    void touch(Clock::time_point now) noexcept {
        if (now > last_activity) last_activity = now;
    }
};

struct SessionSummary {
    std::string session_id;
    Clock::time_point created_at{};
    Clock::time_point last_activity{};
    std::vector<std::string> hostnames;
    std::size_t item_count = 0;
};

} // namespace cloudclip::store
