#include "numscull/client.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>

#include "mock_server.hpp"
#include "numscull/control.hpp"
#include "numscull/crypto.hpp"
#include "numscull/errors.hpp"
#include "numscull/handshake_messages.hpp"
#include "temp_dir.hpp"

using Numscull::Client;
using Numscull::json;
using Numscull::testing::MockServer;
using Numscull::testing::TempDir;
using namespace std::chrono_literals;

namespace {

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(Numscull::Crypto::init(), 0);
        Numscull::Crypto::write_keypair("alice", dir_.str(), Numscull::Crypto::generate_keypair());
        server_ = std::make_unique<MockServer>(dir_.str());
        server_->start();
    }

    void TearDown() override { server_->stop(); }

    Numscull::ClientConfig config(const std::string& identity = "alice") const {
        Numscull::ClientConfig config;
        config.host = "127.0.0.1";
        config.port = server_->port();
        config.identity = identity;
        config.config_dir = dir_.str();
        config.io_timeout = 2000ms;
        return config;
    }

    TempDir dir_;
    std::unique_ptr<MockServer> server_;
};

} // namespace

TEST_F(ClientTest, ConnectAndHandshake) {
    auto client = Client::connect_and_handshake(config());
    ASSERT_TRUE(client->is_connected());

    // The init exchange used id 1; requests continue from 2.
    ASSERT_EQ(client->next_message_id(), 2u);
    const std::string advertised = client->init_response()["params"]["publicKey"]["bytes"];
    const Numscull::PublicKey& server_pk = server_->public_key();
    ASSERT_EQ(advertised, Numscull::Crypto::base64_encode(Numscull::byte_vector(server_pk.data.begin(), server_pk.data.end())));

    client->close();
    ASSERT_FALSE(client->is_connected());
}

TEST_F(ClientTest, ListProjectsWhenEmpty) {
    auto client = Client::connect_and_handshake("127.0.0.1", server_->port(), "alice", dir_.str());
    auto result = Numscull::request(*client, "control/list/project", json::object());
    ASSERT_EQ(result, json({{"projects", json::array()}}));
}

TEST_F(ClientTest, CreateThenListProject) {
    auto client = Client::connect_and_handshake(config());

    Numscull::request(*client, "control/create/project",
                      {{"name", "demo"}, {"repository", "/tmp/demo"}, {"ownerIdentity", "alice"}});
    auto result = Numscull::request(*client, "control/list/project");

    ASSERT_EQ(result["projects"].size(), 1u);
    ASSERT_EQ(result["projects"][0]["name"], "demo");
    ASSERT_EQ(result["projects"][0]["repository"], "/tmp/demo");
    ASSERT_EQ(result["projects"][0]["ownerIdentity"], "alice");

    // Ids increase by one per request.
    auto requests = server_->requests();
    ASSERT_EQ(requests.size(), 2u);
    ASSERT_EQ(requests[0]["id"], 2);
    ASSERT_EQ(requests[1]["id"], 3);
}

TEST_F(ClientTest, RemovedActiveProjectIsRemoteError) {
    auto client = Client::connect_and_handshake(config());
    Numscull::control::create_project(*client, "demo", "/tmp/demo", "alice");
    ASSERT_EQ(Numscull::control::change_project(*client, "demo")["name"], "demo");

    server_->drop_project("demo");

    try {
        client->request("notes/for/file", {{"file", "main.c"}});
        FAIL() << "Expected RemoteError";
    } catch (const Numscull::RemoteError& e) {
        ASSERT_EQ(e.kind(), Numscull::ErrorKind::REMOTE_ERROR);
        ASSERT_NE(e.reason().find("no active project"), std::string::npos);
    }

    // The session survives a remote error.
    ASSERT_TRUE(client->is_connected());
    ASSERT_TRUE(client->request("control/list/project")["projects"].empty());
}

TEST_F(ClientTest, StalledServerTimesOut) {
    auto cfg = config();
    cfg.io_timeout = 300ms;
    auto client = Client::connect_and_handshake(cfg);

    server_->set_stall(true);
    ASSERT_THROW(client->request("control/list/project"), Numscull::ReadTimeout);
    ASSERT_FALSE(client->is_connected());

    const auto started = std::chrono::steady_clock::now();
    ASSERT_THROW(client->request("control/list/project"), Numscull::TransportClosed);
    ASSERT_LT(std::chrono::steady_clock::now() - started, 200ms);
}

TEST_F(ClientTest, LargeMessagesSpanBlocks) {
    server_->register_method_handler("test/echo", [](const json& params) { return params; });
    auto client = Client::connect_and_handshake(config());

    const std::string big(20000, 'q');
    auto result = client->request("test/echo", {{"data", big}});
    ASSERT_EQ(result["data"], big);
    ASSERT_GT(client->channel().send_nonce(), 2u);
    ASSERT_GT(client->channel().recv_nonce(), 2u);
}

TEST_F(ClientTest, HandlerRemoteError) {
    server_->register_method_handler("test/fail", [](const json&) -> json {
        throw Numscull::RemoteError("permission denied");
    });
    auto client = Client::connect_and_handshake(config());

    try {
        client->request("test/fail");
        FAIL() << "Expected RemoteError";
    } catch (const Numscull::RemoteError& e) {
        ASSERT_EQ(e.reason(), "permission denied");
    }

    // send_raw hands back the error envelope untouched.
    auto envelope = client->send_raw("test/fail");
    ASSERT_EQ(envelope["method"], "control/error");
    ASSERT_EQ(envelope["result"]["reason"], "permission denied");
}

TEST_F(ClientTest, UnknownMethodWithActiveProject) {
    auto client = Client::connect_and_handshake(config());
    Numscull::control::create_project(*client, "demo", "/tmp/demo", "alice");
    Numscull::control::change_project(*client, "demo");

    try {
        client->request("does/not/exist");
        FAIL() << "Expected RemoteError";
    } catch (const Numscull::RemoteError& e) {
        ASSERT_EQ(e.reason(), "unknown method: does/not/exist");
    }
}

TEST_F(ClientTest, IndependentSessions) {
    auto first = Client::connect_and_handshake(config());
    auto second = Client::connect_and_handshake(config());

    Numscull::control::create_project(*first, "shared", "/srv/shared", "alice");
    auto listed = second->request("control/list/project");
    ASSERT_EQ(listed["projects"].size(), 1u);

    // Each session keeps its own counters.
    ASSERT_EQ(first->next_message_id(), 3u);
    ASSERT_EQ(second->next_message_id(), 3u);
    ASSERT_EQ(first->channel().send_nonce(), second->channel().send_nonce());
    ASSERT_EQ(server_->sessions(), 2);

    Numscull::close(*first);
    ASSERT_FALSE(first->is_connected());
    ASSERT_TRUE(second->request("control/list/project")["projects"].is_array());
}

TEST_F(ClientTest, CloseIsIdempotent) {
    auto client = Client::connect_and_handshake(config());
    client->close();
    client->close();
    ASSERT_THROW(client->request("control/list/project"), Numscull::TransportClosed);
}

TEST_F(ClientTest, ControlRequests) {
    Numscull::PublicKey bob_pk = Numscull::Crypto::generate_keypair().publicKey;
    server_->register_method_handler("control/add/user/server", [](const json& params) { return params; });
    server_->register_method_handler("control/add/user/project", [](const json& params) { return params; });
    auto client = Client::connect_and_handshake(config());

    ASSERT_EQ(Numscull::control::subscribe(*client, {1, 2})["channels"], json({1, 2}));
    ASSERT_EQ(Numscull::control::unsubscribe(*client, {2})["channels"], json({2}));

    auto added = Numscull::control::add_user_server(*client, "bob", bob_pk);
    ASSERT_EQ(Numscull::Crypto::base64_decode(added["publicKey"]["bytes"].get<std::string>()),
              Numscull::byte_vector(bob_pk.data.begin(), bob_pk.data.end()));

    auto member = Numscull::control::add_user_project(*client, "demo", "bob", json{{"read", true}});
    ASSERT_EQ(member["permissions"]["read"], true);
    ASSERT_FALSE(Numscull::control::add_user_project(*client, "demo", "carol").contains("permissions"));

    Numscull::control::create_project(*client, "tmp", "/tmp/x", "alice");
    Numscull::control::remove_project(*client, "tmp");
    ASSERT_TRUE(server_->project_names().empty());

    Numscull::control::exit(*client);
    ASSERT_FALSE(client->is_connected());
}

TEST_F(ClientTest, UnknownIdentityIsRejected) {
    TempDir other;
    Numscull::Crypto::write_keypair("mallory", other.str(), Numscull::Crypto::generate_keypair());

    auto cfg = config("mallory");
    cfg.config_dir = other.str();
    ASSERT_THROW(Client::connect_and_handshake(cfg), Numscull::HandshakeFailed);
    ASSERT_EQ(server_->sessions(), 0);
}

TEST_F(ClientTest, MissingIdentityFailsBeforeConnecting) {
    ASSERT_THROW(Client::connect_and_handshake(config("nobody")), Numscull::IdentityNotFound);
    ASSERT_TRUE(server_->requests().empty());

    auto cfg = config();
    cfg.config_dir.clear();
    ASSERT_THROW(Client::connect_and_handshake(cfg), Numscull::InvalidArgument);
}

TEST(ClientConnectTest, ConnectionRefused) {
    ASSERT_EQ(Numscull::Crypto::init(), 0);
    TempDir dir;
    Numscull::Crypto::write_keypair("alice", dir.str(), Numscull::Crypto::generate_keypair());

    uint16_t port = 0;
    {
        MockServer server(dir.str());
        server.start();
        port = server.port();
        server.stop();
    }
    ASSERT_THROW(Client::connect_and_handshake("127.0.0.1", port, "alice", dir.str()), Numscull::ConnectionRefused);
}
