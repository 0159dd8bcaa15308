#include "client/ClientState.h"

#include <boost/json.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace cloudclip::client {

namespace json = boost::json;

ClientState::ClientState(std::string path)
    : path_(std::move(path)) {}

void ClientState::load() {
    session_id_.clear();

    std::ifstream in(path_);
    if (!in.is_open()) return;

    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw std::runtime_error("could not read " + path_);

    boost::system::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec) throw std::runtime_error("could not parse " + path_ + ": " + ec.message());

    auto* obj = v.if_object();
    if (!obj) throw std::runtime_error(path_ + " does not hold a JSON object");

    if (auto* id = obj->if_contains("session_id"); id && id->is_string()) {
        session_id_ = json::value_to<std::string>(*id);
    }
}

void ClientState::save() const {
    json::object obj;
    if (has_session()) {
        obj["session_id"] = session_id_;
    } else {
        obj["session_id"] = nullptr;
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("could not open " + path_ + " for writing");

    out << json::serialize(obj) << "\n";
    if (!out) throw std::runtime_error("could not write " + path_);
}

} // namespace cloudclip::client
