#include <gtest/gtest.h>
#include "api/JsonCodec.h"

#include <chrono>
#include <cstdint>
#include <string>

using namespace cloudclip;
using namespace std::chrono;
namespace json = boost::json;

static std::string str(const json::value& v) {
    return json::value_to<std::string>(v);
}

TEST(JsonCodec, FormatsTimestampsAsUtcWithMicroseconds) {
    const auto epoch = store::Clock::from_time_t(0);
    EXPECT_EQ(api::format_timestamp(epoch), "1970-01-01T00:00:00.000000+00:00");
    EXPECT_EQ(api::format_timestamp(epoch + seconds(1) + microseconds(500000)),
              "1970-01-01T00:00:01.500000+00:00");

    // 2021-03-04T05:06:07Z
    const auto t = store::Clock::from_time_t(1614834367) + microseconds(42);
    EXPECT_EQ(api::format_timestamp(t), "2021-03-04T05:06:07.000042+00:00");
}

TEST(JsonCodec, SerializesItem) {
    store::ClipboardItem item;
    item.id = "clip_482913_1";
    item.content = "hello";
    item.timestamp = store::Clock::from_time_t(0);
    item.hostname = "alpha";

    auto obj = api::to_json(item);
    EXPECT_EQ(str(obj.at("id")), "clip_482913_1");
    EXPECT_EQ(str(obj.at("content")), "hello");
    EXPECT_EQ(str(obj.at("hostname")), "alpha");
    EXPECT_EQ(str(obj.at("timestamp")), "1970-01-01T00:00:00.000000+00:00");
}

TEST(JsonCodec, SerializesSummary) {
    store::SessionSummary s;
    s.session_id = "123456";
    s.created_at = store::Clock::from_time_t(0);
    s.last_activity = store::Clock::from_time_t(60);
    s.hostnames = {"alpha", "beta"};
    s.item_count = 3;

    auto obj = api::to_json(s);
    EXPECT_EQ(str(obj.at("session_id")), "123456");
    EXPECT_EQ(str(obj.at("last_activity")), "1970-01-01T00:01:00.000000+00:00");
    EXPECT_EQ(obj.at("item_count").to_number<std::uint64_t>(), 3u);
    ASSERT_EQ(obj.at("hostnames").as_array().size(), 2u);
    EXPECT_EQ(str(obj.at("hostnames").as_array()[1]), "beta");
}

TEST(JsonCodec, ParsesAddItemBody) {
    auto body = api::parse_add_item(R"({"content":"hi there","hostname":"alpha"})");
    EXPECT_EQ(body.content, "hi there");
    EXPECT_EQ(body.hostname, "alpha");

    auto anonymous = api::parse_add_item(R"({"content":"x","hostname":null})");
    EXPECT_EQ(anonymous.hostname, "");

    auto bare = api::parse_add_item(R"({"content":""})");
    EXPECT_EQ(bare.content, "");
    EXPECT_EQ(bare.hostname, "");
}

TEST(JsonCodec, RejectsMalformedAddItemBody) {
    EXPECT_THROW(api::parse_add_item("not json"), api::BadRequest);
    EXPECT_THROW(api::parse_add_item(""), api::BadRequest);
    EXPECT_THROW(api::parse_add_item(R"(["content"])"), api::BadRequest);
    EXPECT_THROW(api::parse_add_item(R"({"hostname":"a"})"), api::BadRequest);
    EXPECT_THROW(api::parse_add_item(R"({"content":5})"), api::BadRequest);
    EXPECT_THROW(api::parse_add_item(R"({"content":"x","hostname":7})"), api::BadRequest);
}
