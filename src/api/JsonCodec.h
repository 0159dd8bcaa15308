#pragma once

#include "store/Session.hpp"

#include <boost/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace cloudclip::api {

namespace json = boost::json;

// Body that failed validation (not JSON, wrong field types, missing content).
class BadRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ISO-8601 in UTC with microseconds, e.g. "2026-10-18T09:14:03.512004+00:00".
std::string format_timestamp(store::Clock::time_point tp);

json::object to_json(const store::ClipboardItem& item);
json::object to_json(const store::SessionSummary& summary);
json::array to_json(const std::vector<store::ClipboardItem>& items);
json::array to_json(const std::vector<store::SessionSummary>& summaries);

json::object message(const std::string& text);
json::object detail(const std::string& text);

struct AddItemBody {
    std::string content;
    std::string hostname;  // empty when absent or null
};

// Throws BadRequest.
AddItemBody parse_add_item(const std::string& body);

} // namespace cloudclip::api
