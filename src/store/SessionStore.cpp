#include "store/SessionStore.h"
#include "store/StoreError.hpp"

#include <algorithm>
#include <utility>

namespace cloudclip::store {

SessionStore::SessionStore()
    : SessionStore([] { return Clock::now(); }) {}

SessionStore::SessionStore(NowFn now, std::size_t max_code_attempts)
    : now_(std::move(now)),
      codes_(max_code_attempts) {}

std::string SessionStore::create_explicit() {
    std::lock_guard<std::mutex> lk(mu_);
    const auto now = now_();
    sweep_locked_(now);

    std::string code = codes_.generate_unique(index_);
    insert_locked_(code, now);
    return code;
}

Session SessionStore::get_or_create(const std::string& session_id, const std::string& hostname) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto now = now_();
    sweep_locked_(now);
    return get_or_create_locked_(session_id, hostname, now);
}

ClipboardItem SessionStore::add_item(const std::string& session_id,
                                     std::string content,
                                     const std::string& hostname) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto now = now_();
    sweep_locked_(now);
    Session& session = get_or_create_locked_(session_id, hostname, now);

    ClipboardItem item;
    item.id = make_item_id_(session_id, ++session.last_sequence);
    item.content = std::move(content);
    item.timestamp = now;
    item.hostname = hostname.empty() ? std::string(kUnknownHostname) : hostname;

    session.items.push_back(item);
    while (session.items.size() > kMaxItemsPerSession) {
        session.items.pop_front();
    }
    return item;
}

ClipboardItem SessionStore::latest(const std::string& session_id, const std::string& hostname) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto now = now_();
    sweep_locked_(now);
    const Session& session = get_or_create_locked_(session_id, hostname, now);

    if (session.items.empty()) {
        throw NotFound("No clipboard items found in session");
    }
    return session.items.back();
}

std::vector<ClipboardItem> SessionStore::history(const std::string& session_id, const std::string& hostname) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto now = now_();
    sweep_locked_(now);
    const Session& session = get_or_create_locked_(session_id, hostname, now);
    return {session.items.begin(), session.items.end()};
}

bool SessionStore::end(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    sweep_locked_(now_());

    auto it = index_.find(session_id);
    if (it == index_.end()) {
        throw NotFound("Session not found");
    }
    sessions_.erase(it->second);
    index_.erase(it);
    return true;
}

SessionSummary SessionStore::status(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    sweep_locked_(now_());

    auto it = index_.find(session_id);
    if (it == index_.end()) {
        throw NotFound("Session not found");
    }
    return summarize_(*it->second);
}

std::vector<SessionSummary> SessionStore::list_active() {
    std::lock_guard<std::mutex> lk(mu_);
    sweep_locked_(now_());

    std::vector<SessionSummary> out;
    out.reserve(sessions_.size());
    for (const auto& session : sessions_) {
        out.push_back(summarize_(session));
    }
    return out;
}

std::size_t SessionStore::clear_all() {
    std::lock_guard<std::mutex> lk(mu_);
    const std::size_t count = sessions_.size();
    sessions_.clear();
    index_.clear();
    return count;
}

std::size_t SessionStore::sweep_expired() {
    std::lock_guard<std::mutex> lk(mu_);
    return sweep_locked_(now_());
}

std::size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

std::size_t SessionStore::sweep_locked_(Clock::time_point now) {
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (is_expired(it->last_activity, now)) {
            index_.erase(it->session_id);
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

Session& SessionStore::get_or_create_locked_(const std::string& session_id,
                                             const std::string& hostname,
                                             Clock::time_point now) {
    auto it = index_.find(session_id);
    Session& session = (it == index_.end()) ? insert_locked_(session_id, now) : *it->second;

    session.touch(now);

    if (!hostname.empty() &&
        std::find(session.hostnames.begin(), session.hostnames.end(), hostname) == session.hostnames.end()) {
        session.hostnames.push_back(hostname);
    }
    return session;
}

Session& SessionStore::insert_locked_(const std::string& session_id, Clock::time_point now) {
    Session session;
    session.session_id = session_id;
    session.created_at = now;
    session.last_activity = now;

    auto pos = sessions_.insert(sessions_.end(), std::move(session));
    index_.emplace(session_id, pos);
    return *pos;
}

SessionSummary SessionStore::summarize_(const Session& session) {
    SessionSummary summary;
    summary.session_id = session.session_id;
    summary.created_at = session.created_at;
    summary.last_activity = session.last_activity;
    summary.hostnames = session.hostnames;
    summary.item_count = session.items.size();
    return summary;
}

std::string SessionStore::make_item_id_(const std::string& session_id, std::uint64_t sequence) {
    return "clip_" + session_id + "_" + std::to_string(sequence);
}

} // namespace cloudclip::store
