#pragma once

#include <string>
#include <utility>

namespace cloudclip::client {

// The session id this machine last started or joined, kept in a small JSON
// file ({"session_id": "482913"}) between invocations.
class ClientState {
public:
    explicit ClientState(std::string path);

    // A missing file leaves the state empty. Throws std::runtime_error if
    // the file exists but cannot be read or parsed.
    void load();

    // Throws std::runtime_error if the file cannot be written.
    void save() const;

    bool has_session() const noexcept { return !session_id_.empty(); }
    const std::string& session_id() const noexcept { return session_id_; }
    const std::string& path() const noexcept { return path_; }

    void set_session_id(std::string id) { session_id_ = std::move(id); }
    void clear() noexcept { session_id_.clear(); }

private:
    std::string path_;
    std::string session_id_;
};

} // namespace cloudclip::client
