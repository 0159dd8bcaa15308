#include <gtest/gtest.h>

#include "api/RequestHandlers.h"
#include "client/ClientState.h"
#include "client/Clipboard.hpp"
#include "client/ClipboardClient.h"
#include "networking/ClientError.hpp"
#include "store/SessionStore.h"
#include "store/StoreError.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace cloudclip;
namespace fs = std::filesystem;

namespace {

const std::string kKey = "client-test-key";

fs::path temp_state_path(const std::string& tag) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    return fs::temp_directory_path() /
           ("cloudclip_" + tag + "_" + info->name() + "_" + std::to_string(::getpid()) + ".json");
}

// One machine: its own clipboard streams, state file and log, all talking
// to the same in-process server.
struct Machine {
    Machine(api::RequestHandlers& server, const std::string& host, const std::string& key = kKey)
        : state_path(temp_state_path(host)),
          state(state_path.string()),
          clipboard(in, out),
          client([&server](const networking::Request& req) { return server.handle(req); },
                 key, host, state, clipboard, log) {}

    ~Machine() {
        std::error_code ec;
        fs::remove(state_path, ec);
    }

    void copy(const std::string& text) {
        in.clear();
        in.str(text);
    }

    fs::path state_path;
    client::ClientState state;
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream log;
    client::StreamClipboard clipboard;
    client::ClipboardClient client;
};

class ClipboardClientTest : public ::testing::Test {
protected:
    ClipboardClientTest()
        : server(store, kKey) {}

    store::SessionStore store;
    api::RequestHandlers server;
};

} // namespace

TEST(ClientState, MissingFileIsEmpty) {
    client::ClientState state((fs::temp_directory_path() / "cloudclip_does_not_exist.json").string());
    state.load();
    EXPECT_FALSE(state.has_session());
}

TEST(ClientState, SaveThenLoad) {
    const auto path = temp_state_path("state");
    {
        client::ClientState state(path.string());
        state.set_session_id("482913");
        state.save();
    }
    client::ClientState reloaded(path.string());
    reloaded.load();
    EXPECT_EQ(reloaded.session_id(), "482913");

    reloaded.clear();
    reloaded.save();
    client::ClientState cleared(path.string());
    cleared.load();
    EXPECT_FALSE(cleared.has_session());

    fs::remove(path);
}

TEST(ClientState, CorruptFileThrows) {
    const auto path = temp_state_path("corrupt");
    std::ofstream(path) << "{not json";

    client::ClientState state(path.string());
    EXPECT_THROW(state.load(), std::runtime_error);
    fs::remove(path);
}

TEST_F(ClipboardClientTest, StartRemembersSession) {
    Machine alpha(server, "alpha");
    ASSERT_TRUE(alpha.client.start_session());
    ASSERT_TRUE(alpha.state.has_session());
    EXPECT_TRUE(client::ClipboardClient::is_valid_code(alpha.state.session_id()));

    client::ClientState reloaded(alpha.state_path.string());
    reloaded.load();
    EXPECT_EQ(reloaded.session_id(), alpha.state.session_id());
}

TEST_F(ClipboardClientTest, SendOnOneMachineGetOnAnother) {
    Machine alpha(server, "alpha");
    Machine beta(server, "beta");

    ASSERT_TRUE(alpha.client.start_session());
    const std::string code = alpha.state.session_id();
    ASSERT_TRUE(beta.client.join_session(code));

    alpha.copy("shared text\nline two");
    ASSERT_TRUE(alpha.client.send_clipboard());

    ASSERT_TRUE(beta.client.get_clipboard());
    EXPECT_EQ(beta.out.str(), "shared text\nline two");
    EXPECT_NE(beta.log.str().find("from alpha"), std::string::npos);

    EXPECT_EQ(store.status(code).hostnames, (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(ClipboardClientTest, JoinValidatesCodeLocally) {
    Machine alpha(server, "alpha");
    EXPECT_FALSE(alpha.client.join_session("12345"));
    EXPECT_FALSE(alpha.client.join_session("abcdef"));
    EXPECT_FALSE(alpha.state.has_session());
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(ClipboardClientTest, JoinUnknownSessionFails) {
    Machine alpha(server, "alpha");
    EXPECT_FALSE(alpha.client.join_session("123456"));
    EXPECT_FALSE(alpha.state.has_session());
    // The existence check must not create the session.
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(ClipboardClientTest, BlankClipboardIsNotSent) {
    Machine alpha(server, "alpha");
    ASSERT_TRUE(alpha.client.start_session());

    alpha.copy("  \n\t");
    EXPECT_FALSE(alpha.client.send_clipboard());
    EXPECT_NE(alpha.log.str().find("Clipboard is empty"), std::string::npos);
    EXPECT_EQ(store.status(alpha.state.session_id()).item_count, 0u);
}

TEST_F(ClipboardClientTest, CommandsNeedASession) {
    Machine alpha(server, "alpha");
    alpha.copy("x");
    EXPECT_FALSE(alpha.client.send_clipboard());
    EXPECT_FALSE(alpha.client.get_clipboard());
    EXPECT_FALSE(alpha.client.show_history());
    EXPECT_FALSE(alpha.client.end_session());
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(ClipboardClientTest, GetOnEmptySessionLeavesClipboardAlone) {
    Machine alpha(server, "alpha");
    ASSERT_TRUE(alpha.client.start_session());

    EXPECT_FALSE(alpha.client.get_clipboard());
    EXPECT_TRUE(alpha.out.str().empty());
}

TEST_F(ClipboardClientTest, HistoryListsNewestFirst) {
    Machine alpha(server, "alpha");
    ASSERT_TRUE(alpha.client.start_session());

    alpha.copy("first");
    ASSERT_TRUE(alpha.client.send_clipboard());
    alpha.copy("second");
    ASSERT_TRUE(alpha.client.send_clipboard());

    alpha.log.str("");
    ASSERT_TRUE(alpha.client.show_history());
    const std::string out = alpha.log.str();
    EXPECT_LT(out.find("second"), out.find("first"));
}

TEST_F(ClipboardClientTest, EndForgetsSession) {
    Machine alpha(server, "alpha");
    ASSERT_TRUE(alpha.client.start_session());
    const std::string code = alpha.state.session_id();

    ASSERT_TRUE(alpha.client.end_session());
    EXPECT_FALSE(alpha.state.has_session());
    EXPECT_THROW(store.status(code), store::NotFound);

    client::ClientState reloaded(alpha.state_path.string());
    reloaded.load();
    EXPECT_FALSE(reloaded.has_session());
}

TEST_F(ClipboardClientTest, StatusAndSessionListing) {
    Machine alpha(server, "alpha");
    ASSERT_TRUE(alpha.client.start_session());

    EXPECT_TRUE(alpha.client.show_status());
    EXPECT_NE(alpha.log.str().find(alpha.state.session_id()), std::string::npos);

    alpha.log.str("");
    EXPECT_TRUE(alpha.client.list_sessions());
    EXPECT_NE(alpha.log.str().find(alpha.state.session_id()), std::string::npos);
}

TEST_F(ClipboardClientTest, WrongKeyIsReported) {
    Machine mallory(server, "mallory", "wrong-key");
    EXPECT_FALSE(mallory.client.start_session());
    EXPECT_NE(mallory.log.str().find("401"), std::string::npos);
    EXPECT_FALSE(mallory.state.has_session());
}

TEST(ClipboardClient, MalformedResponseIsProtocolError) {
    client::ClientState state((fs::temp_directory_path() / "cloudclip_unused.json").string());
    std::istringstream in;
    std::ostringstream out, log;
    client::StreamClipboard clipboard(in, out);

    client::ClipboardClient cc(
        [](const networking::Request&) {
            networking::Response res;
            res.body = "<html>proxy error</html>";
            return res;
        },
        kKey, "alpha", state, clipboard, log);

    try {
        cc.start_session();
        FAIL() << "expected ClientError";
    } catch (const networking::ClientError& e) {
        EXPECT_EQ(e.kind(), networking::ClientError::Kind::Protocol);
    }
}
