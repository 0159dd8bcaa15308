#pragma once

#include "store/CodeGenerator.hpp"
#include "store/ExpiryPolicy.hpp"
#include "store/Session.hpp"

#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudclip::store {

// In-memory session table shared by every request worker.
//
// One mutex guards the whole table. Each public call takes it exactly once,
// runs the expiry sweep first and then does its own work, so a sweep never
// interleaves with another caller and get-or-create plus the write that
// follows it are a single atomic step.
class SessionStore {
public:
    using NowFn = std::function<Clock::time_point()>;

    SessionStore();
    explicit SessionStore(NowFn now, std::size_t max_code_attempts = CodeGenerator::kDefaultMaxAttempts);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Fresh empty session under a newly generated code.
    // Throws ExhaustedCodespace if no free code was found.
    std::string create_explicit();

    // Returns the session, creating an empty one if `session_id` is unknown.
    // Any string is accepted as an id. A non-empty hostname is recorded.
    //
    // NOTE: reads go through here too, so a read against an unknown id
    // materializes that session instead of failing.
    Session get_or_create(const std::string& session_id, const std::string& hostname = {});

    ClipboardItem add_item(const std::string& session_id,
                           std::string content,
                           const std::string& hostname = {});

    // Throws NotFound if the session holds no items.
    ClipboardItem latest(const std::string& session_id, const std::string& hostname = {});

    std::vector<ClipboardItem> history(const std::string& session_id, const std::string& hostname = {});

    // Throws NotFound if there is no such session.
    bool end(const std::string& session_id);

    // Summary of a live session without touching or creating it.
    // Throws NotFound if there is no such session.
    SessionSummary status(const std::string& session_id);

    // Insertion order.
    std::vector<SessionSummary> list_active();

    // Drops every session; returns how many there were.
    std::size_t clear_all();

    std::size_t sweep_expired();

    std::size_t size() const;

private:
    using SessionList = std::list<Session>;

    std::size_t sweep_locked_(Clock::time_point now);
    Session& get_or_create_locked_(const std::string& session_id,
                                   const std::string& hostname,
                                   Clock::time_point now);
    Session& insert_locked_(const std::string& session_id, Clock::time_point now);

    static SessionSummary summarize_(const Session& session);
    static std::string make_item_id_(const std::string& session_id, std::uint64_t sequence);

private:
    NowFn now_;
    CodeGenerator codes_;

    mutable std::mutex mu_;
    SessionList sessions_;
    std::unordered_map<std::string, SessionList::iterator> index_;
};

} // namespace cloudclip::store
