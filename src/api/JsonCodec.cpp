#include "api/JsonCodec.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace cloudclip::api {

std::string format_timestamp(store::Clock::time_point tp) {
    using namespace std::chrono;

    const auto secs = floor<seconds>(tp);
    const auto micros = duration_cast<microseconds>(tp - secs).count();

    const std::time_t t = store::Clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06lld+00:00", date, static_cast<long long>(micros));
    return out;
}

json::object to_json(const store::ClipboardItem& item) {
    return {
        {"id", item.id},
        {"content", item.content},
        {"timestamp", format_timestamp(item.timestamp)},
        {"hostname", item.hostname}
    };
}

json::object to_json(const store::SessionSummary& summary) {
    json::array hostnames;
    for (const auto& h : summary.hostnames) hostnames.emplace_back(h);

    return {
        {"session_id", summary.session_id},
        {"created_at", format_timestamp(summary.created_at)},
        {"last_activity", format_timestamp(summary.last_activity)},
        {"hostnames", hostnames},
        {"item_count", summary.item_count}
    };
}

json::array to_json(const std::vector<store::ClipboardItem>& items) {
    json::array out;
    out.reserve(items.size());
    for (const auto& item : items) out.emplace_back(to_json(item));
    return out;
}

json::array to_json(const std::vector<store::SessionSummary>& summaries) {
    json::array out;
    out.reserve(summaries.size());
    for (const auto& s : summaries) out.emplace_back(to_json(s));
    return out;
}

json::object message(const std::string& text) {
    return {{"message", text}};
}

json::object detail(const std::string& text) {
    return {{"detail", text}};
}

AddItemBody parse_add_item(const std::string& body) {
    boost::system::error_code ec;
    json::value v = json::parse(body, ec);
    if (ec) throw BadRequest("invalid json: " + ec.message());

    auto* obj = v.if_object();
    if (!obj) throw BadRequest("body must be a JSON object");

    AddItemBody out;

    auto* content = obj->if_contains("content");
    if (!content || !content->is_string()) {
        throw BadRequest("field 'content' is required and must be a string");
    }
    out.content = json::value_to<std::string>(*content);

    if (auto* hostname = obj->if_contains("hostname")) {
        if (hostname->is_string()) {
            out.hostname = json::value_to<std::string>(*hostname);
        } else if (!hostname->is_null()) {
            throw BadRequest("field 'hostname' must be a string");
        }
    }
    return out;
}

} // namespace cloudclip::api
