#include "paper/client.hpp"

#include <gtest/gtest.h>

#include <memory>

#include "support/fake_server.hpp"

namespace paper::test {

class ClientTest : public ::testing::Test {
   protected:
    void SetUp() override {
        server_ = std::make_unique<FakeServer>();
        server_->start();

        ClientOptions options;
        options.timeout = util::Duration(2000);
        options.connect_timeout = util::Duration(2000);
        client_ = std::make_unique<Client>(server_->address(), options);
    }

    void TearDown() override {
        client_->disconnect();
        server_->stop();
    }

    std::unique_ptr<FakeServer> server_;
    std::unique_ptr<Client> client_;
};

TEST(ClientAddressTest, BadAddressThrowsBeforeConnecting) {
    EXPECT_THROW(Client("redis://127.0.0.1:3145"), AddressError);
    EXPECT_THROW(Client("paper://127.0.0.1"), AddressError);
}

TEST(ClientAddressTest, ConstructionDoesNotConnect) {
    Client client("paper://127.0.0.1:3145");
    EXPECT_EQ(client.state(), ConnectionState::Disconnected);
    EXPECT_EQ(client.endpoint().port, 3145);
}

TEST_F(ClientTest, ConnectsLazily) {
    EXPECT_FALSE(client_->connected());
    EXPECT_EQ(client_->ping(), "pong");
    EXPECT_TRUE(client_->connected());
    EXPECT_EQ(server_->connections_accepted(), 1u);
}

TEST_F(ClientTest, SetThenGet) {
    client_->set("hello", "world");

    auto value = client_->get("hello");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "world");
}

TEST_F(ClientTest, GetMissingIsAbsence) {
    EXPECT_FALSE(client_->get("missing-key").has_value());
    EXPECT_TRUE(client_->connected());
}

TEST_F(ClientTest, SetTtlThenTtl) {
    client_->set("hello", "world");
    client_->set_ttl("hello", util::Seconds(5));

    auto ttl = client_->ttl("hello");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_GT(ttl->count(), 0);
    EXPECT_LE(ttl->count(), 5);
}

TEST_F(ClientTest, TtlAbsentWithoutExpiry) {
    client_->set("forever", "v");
    EXPECT_FALSE(client_->ttl("forever").has_value());
    EXPECT_FALSE(client_->ttl("missing").has_value());

    client_->set("brief", "v", util::Seconds(30));
    client_->set_ttl("brief", std::nullopt);
    EXPECT_FALSE(client_->ttl("brief").has_value());
}

TEST_F(ClientTest, SetTtlOnMissingKeyIsProtocolError) {
    try {
        client_->set_ttl("missing", util::Seconds(5));
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_TRUE(e.reply().is(CacheErrorCode::KeyNotFound));
    }
    EXPECT_TRUE(client_->connected());
}

TEST_F(ClientTest, ServerClosesMidResponse) {
    client_->set("hello", "world");

    server_->inject(Fault::CloseMidResponse);
    EXPECT_THROW((void)client_->get("hello"), ConnectionError);
    EXPECT_EQ(client_->state(), ConnectionState::Faulted);
    EXPECT_FALSE(client_->last_error().empty());
}

TEST_F(ClientTest, NegativeResizeRejectedLocally) {
    EXPECT_THROW(client_->resize(-1), ArgumentError);
    EXPECT_EQ(server_->bytes_received(), 0u);
}

TEST_F(ClientTest, ZeroResizeRejectedByServer) {
    try {
        client_->resize(0);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_TRUE(e.reply().is(CacheErrorCode::ZeroCacheSize));
    }
}

TEST_F(ClientTest, ResizeChangesCapacity) {
    client_->resize(4096);
    EXPECT_EQ(client_->size().max_size, 4096u);
}

TEST_F(ClientTest, EmptyKeyIsArgumentErrorAndSendsNothing) {
    client_->connect();
    EXPECT_THROW(client_->set("", "v"), ArgumentError);
    EXPECT_THROW((void)client_->get(""), ArgumentError);
    EXPECT_EQ(server_->bytes_received(), 0u);
    EXPECT_TRUE(client_->connected());
}

TEST_F(ClientTest, EmptyValueRejectedByServer) {
    try {
        client_->set("k", "");
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_TRUE(e.reply().is(CacheErrorCode::ZeroValueSize));
    }
}

TEST_F(ClientTest, Version) {
    EXPECT_EQ(client_->version(), "0.1.0-fake");
}

TEST_F(ClientTest, DelAndHas) {
    client_->set("k", "v");
    EXPECT_TRUE(client_->has("k"));
    EXPECT_TRUE(client_->del("k"));
    EXPECT_FALSE(client_->has("k"));
    EXPECT_FALSE(client_->del("k"));
}

TEST_F(ClientTest, PeekDoesNotCountAsGet) {
    client_->set("k", "v");

    auto value = client_->peek("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "v");
    EXPECT_FALSE(client_->peek("missing").has_value());
    EXPECT_EQ(client_->status().total_gets, 0u);
}

TEST_F(ClientTest, ValueSize) {
    client_->set("k", "12345");
    EXPECT_EQ(client_->value_size("k"), 5u);
    EXPECT_FALSE(client_->value_size("missing").has_value());
}

TEST_F(ClientTest, SizeFromStatus) {
    client_->set("a", "123");
    client_->set("b", "4567");

    auto size = client_->size();
    EXPECT_EQ(size.num_objects, 2u);
    EXPECT_EQ(size.used_size, 7u);
    EXPECT_GT(size.max_size, 0u);
}

TEST_F(ClientTest, ClearAndWipeEmptyTheCache) {
    client_->set("a", "1");
    client_->clear();
    EXPECT_EQ(client_->size().num_objects, 0u);

    client_->set("b", "2");
    client_->wipe();
    EXPECT_FALSE(client_->has("b"));
}

TEST_F(ClientTest, Policy) {
    auto info = client_->policy_get();
    EXPECT_EQ(info.policy, Policy{Policy::Kind::Lfu});
    EXPECT_EQ(info.policies.size(), 3u);
    EXPECT_FALSE(info.is_auto);

    client_->policy_set(Policy::two_q(0.25, 0.5));
    EXPECT_EQ(client_->policy_get().policy, Policy::two_q(0.25, 0.5));
}

TEST_F(ClientTest, UnconfiguredPolicyIsProtocolError) {
    try {
        client_->policy_set(Policy{Policy::Kind::Arc});
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_TRUE(e.reply().is(CacheErrorCode::UnconfiguredPolicy));
        EXPECT_EQ(e.origin(), ErrorOrigin::Cache);
    }
}

TEST_F(ClientTest, StatusCountsOperations) {
    client_->set("k", "v");
    (void)client_->get("k");
    (void)client_->get("missing");
    (void)client_->del("k");

    auto status = client_->status();
    EXPECT_EQ(status.total_sets, 1u);
    EXPECT_EQ(status.total_gets, 2u);
    EXPECT_EQ(status.total_dels, 1u);
    EXPECT_DOUBLE_EQ(status.miss_ratio, 0.5);
}

TEST_F(ClientTest, FaultedClientStaysFaulted) {
    client_->connect();
    server_->inject(Fault::CloseBeforeResponse);
    EXPECT_THROW(client_->ping(), ConnectionError);

    EXPECT_THROW(client_->ping(), ConnectionError);
    EXPECT_EQ(client_->state(), ConnectionState::Faulted);
    EXPECT_EQ(server_->connections_accepted(), 1u);
}

TEST_F(ClientTest, ReconnectClearsFault) {
    client_->connect();
    server_->inject(Fault::Garbage);
    EXPECT_THROW(client_->ping(), CodecError);
    EXPECT_EQ(client_->state(), ConnectionState::Faulted);

    client_->reconnect();
    EXPECT_TRUE(client_->connected());
    EXPECT_TRUE(client_->last_error().empty());
    EXPECT_EQ(client_->ping(), "pong");
}

TEST_F(ClientTest, TimeoutFaults) {
    ClientOptions options;
    options.timeout = util::Duration(100);
    Client client(server_->address(), options);
    client.connect();

    server_->inject(Fault::Stall);
    EXPECT_THROW(client.ping(), TimeoutError);
    EXPECT_EQ(client.state(), ConnectionState::Faulted);
    client.disconnect();
}

TEST_F(ClientTest, ReconnectAttemptsRetryAfterFault) {
    ClientOptions options;
    options.timeout = util::Duration(2000);
    options.reconnect_attempts = 1;
    Client client(server_->address(), options);
    client.set("k", "v");

    server_->inject(Fault::CloseBeforeResponse);
    auto value = client.get("k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "v");
    EXPECT_TRUE(client.connected());
    EXPECT_EQ(server_->connections_accepted(), 2u);
    client.disconnect();
}

TEST_F(ClientTest, ErrorRepliesAreNotRetried) {
    ClientOptions options;
    options.reconnect_attempts = 3;
    Client client(server_->address(), options);

    EXPECT_THROW(client.set("k", ""), ProtocolError);
    EXPECT_EQ(server_->requests_received(), 1u);
    EXPECT_EQ(server_->connections_accepted(), 1u);
    client.disconnect();
}

TEST_F(ClientTest, MoveKeepsConnection) {
    client_->set("k", "v");
    Client moved = std::move(*client_);
    EXPECT_TRUE(moved.connected());
    EXPECT_EQ(moved.get("k"), "v");
    moved.disconnect();

    // the fixture's client is moved-from; give TearDown a live one
    client_ = std::make_unique<Client>(server_->address());
}

TEST(ClientMoveTest, MovedFromClientReportsDisconnected) {
    Client original("paper://127.0.0.1:3145");
    Client target = std::move(original);

    EXPECT_EQ(target.endpoint().port, 3145);
    EXPECT_FALSE(original.connected());
    EXPECT_EQ(original.state(), ConnectionState::Disconnected);
    EXPECT_TRUE(original.last_error().empty());
    EXPECT_TRUE(original.endpoint().host.empty());
    original.disconnect();
}

}  // namespace paper::test
