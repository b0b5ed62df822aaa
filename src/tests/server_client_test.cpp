#include <gtest/gtest.h>
#include "network/client.hpp"
#include "network/server.hpp"
#include "network/tcp_stream.hpp"
#include "crypto/key_derivation.hpp"
#include "crypto/key_exchange.hpp"
#include "test_utils.hpp"
#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace pneumatic::network;

class ServerClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging(boost::log::trivial::fatal);
    }

    void TearDown() override {
        if (server) {
            server->shutdown();
        }
    }

    void start(UnsupportedProtocolPolicy policy = UnsupportedProtocolPolicy::KEEP_OPEN) {
        server = std::make_unique<Server>("127.0.0.1", 0, policy);
        ASSERT_TRUE(server->start_listener());
        ASSERT_NE(server->local_port(), 0);
    }

    std::unique_ptr<Client> connect() {
        return Client::connect("127.0.0.1", server->local_port());
    }

    bool registry_drains_to(std::size_t expected) {
        return wait_until([this, expected]() { return server->registry().size() == expected; });
    }

    std::unique_ptr<Server> server;
};

TEST_F(ServerClientTest, MultipleStartRejected) {
    start();
    EXPECT_FALSE(server->start_listener());
}

// Test that a restarted server accepts connections again
TEST_F(ServerClientTest, RestartAfterShutdown) {
    start();
    server->shutdown();
    ASSERT_TRUE(server->start_listener());

    auto client = connect();
    EXPECT_EQ(client->greet().status, GreetingStatus::PROTOCOL_OK);
    EXPECT_TRUE(client->close());
}

// Test that the session is registered by the time the handshake completes
TEST_F(ServerClientTest, SessionRegisteredOnConnect) {
    start();
    auto client = connect();

    EXPECT_EQ(client->state(), SessionState::State::ESTABLISHED);
    EXPECT_EQ(server->registry().size(), 1u);

    const auto response = client->greet();
    EXPECT_EQ(response.status, GreetingStatus::PROTOCOL_OK);

    EXPECT_TRUE(client->close());
    EXPECT_EQ(client->state(), SessionState::State::CLOSED);
    EXPECT_TRUE(registry_drains_to(0));
}

TEST_F(ServerClientTest, VersionMismatchKeepsSessionOpen) {
    start(UnsupportedProtocolPolicy::KEEP_OPEN);
    auto client = connect();

    EXPECT_EQ(client->greet(PROTOCOL_VERSION + 1).status, GreetingStatus::UNSUPPORTED_PROTOCOL);
    EXPECT_EQ(client->greet().status, GreetingStatus::PROTOCOL_OK);
    EXPECT_EQ(server->registry().size(), 1u);

    EXPECT_TRUE(client->close());
    EXPECT_TRUE(registry_drains_to(0));
}

TEST_F(ServerClientTest, VersionMismatchClosesSession) {
    start(UnsupportedProtocolPolicy::CLOSE);
    auto client = connect();

    EXPECT_EQ(client->greet(PROTOCOL_VERSION + 1).status, GreetingStatus::UNSUPPORTED_PROTOCOL);
    EXPECT_TRUE(registry_drains_to(0));

    // The server says Disconnect before hanging up
    EXPECT_EQ(client->receive(), Message{Disconnect{}});
    EXPECT_EQ(client->state(), SessionState::State::CLOSED);
    EXPECT_THROW(client->send(Greeting{}), ProtocolViolation);
    EXPECT_FALSE(client->close(std::chrono::milliseconds(200)));
}

// Test that concurrent connect, greet and close cycles leave no sessions behind
TEST_F(ServerClientTest, ConcurrentClientsLeaveRegistryEmpty) {
    start();

    constexpr int CLIENTS = 16;
    constexpr int ROUNDS = 3;
    std::atomic<int> greeted{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < CLIENTS; ++i) {
        threads.emplace_back([this, &greeted]() {
            for (int round = 0; round < ROUNDS; ++round) {
                auto client = connect();
                if (client->greet().status == GreetingStatus::PROTOCOL_OK) {
                    ++greeted;
                }
                client->close();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(greeted.load(), CLIENTS * ROUNDS);
    EXPECT_TRUE(registry_drains_to(0));
}

// Test that one corrupt frame only ends the offending session
TEST_F(ServerClientTest, CorruptFrameDropsOnlyThatSession) {
    start();
    auto healthy = connect();

    const std::size_t handshake_size =
        pneumatic::crypto::EphemeralKeyPair::PUBLIC_KEY_SIZE + pneumatic::crypto::SALT_SIZE;
    std::unique_ptr<Stream> stream = TCP_Stream::connect("127.0.0.1", server->local_port());
    auto tampering = std::make_unique<pneumatic::testing::TamperingStream>(
        std::move(stream), handshake_size + SecureChannel::LENGTH_PREFIX_SIZE + 1);
    Client corrupt(SecureChannel::establish(std::move(tampering)));

    EXPECT_TRUE(wait_until([this]() { return server->registry().size() == 2; }));

    corrupt.send(Greeting{});
    EXPECT_THROW(corrupt.receive(), ConnectionClosedError);
    EXPECT_TRUE(registry_drains_to(1));

    EXPECT_EQ(healthy->greet().status, GreetingStatus::PROTOCOL_OK);
    EXPECT_TRUE(healthy->close());
    corrupt.close(std::chrono::milliseconds(200));
}

// Test that shutdown closes live sessions and joins their handlers
TEST_F(ServerClientTest, ShutdownClosesLiveSessions) {
    start();
    auto first = connect();
    auto second = connect();
    ASSERT_EQ(first->greet().status, GreetingStatus::PROTOCOL_OK);
    ASSERT_EQ(second->greet().status, GreetingStatus::PROTOCOL_OK);

    server->shutdown();

    EXPECT_EQ(server->registry().size(), 0u);
    EXPECT_FALSE(server->is_running());

    EXPECT_EQ(first->receive(), Message{Disconnect{}});
    EXPECT_EQ(first->state(), SessionState::State::CLOSED);
    EXPECT_EQ(second->receive(), Message{Disconnect{}});
    EXPECT_EQ(second->state(), SessionState::State::CLOSED);
}

// Test that dropping a started server joins its threads and tells live clients
TEST_F(ServerClientTest, DestructionWithoutShutdownJoinsHandlers) {
    start();
    auto client = connect();
    ASSERT_EQ(client->greet().status, GreetingStatus::PROTOCOL_OK);

    server.reset();

    EXPECT_EQ(client->receive(), Message{Disconnect{}});
    EXPECT_EQ(client->state(), SessionState::State::CLOSED);
}

TEST_F(ServerClientTest, ShutdownIsIdempotent) {
    start();
    server->shutdown();
    server->shutdown();
    EXPECT_FALSE(server->is_running());
    EXPECT_TRUE(server->start_listener());
    EXPECT_TRUE(server->is_running());
}

TEST_F(ServerClientTest, ConnectToClosedPortFails) {
    start();
    const uint16_t port = server->local_port();
    server->shutdown();

    EXPECT_THROW(Client::connect("127.0.0.1", port), HandshakeError);
}

// Test that close is bounded even when nothing is read on the other end
TEST_F(ServerClientTest, CloseReturnsWithinTimeout) {
    start();
    auto client = connect();

    const auto begin = std::chrono::steady_clock::now();
    client->close(std::chrono::milliseconds(500));
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(client->state(), SessionState::State::CLOSED);
}

TEST_F(ServerClientTest, OperationsAfterCloseRejected) {
    start();
    auto client = connect();
    client->close();

    EXPECT_THROW(client->greet(), ProtocolViolation);
    EXPECT_FALSE(client->close());
}

// Test that a Disconnect from the peer ends the client side too
TEST(ClientTest, PeerDisconnectClosesClient) {
    init_test_logging(boost::log::trivial::fatal);
    boost::asio::io_context io_context;
    auto streams = make_stream_pair(io_context);

    auto peer_side = std::async(std::launch::async, [stream = std::move(streams.second)]() mutable {
        return SecureChannel::establish(std::move(stream));
    });
    Client client(SecureChannel::establish(std::move(streams.first)));
    auto peer = peer_side.get();

    peer->send(Disconnect{});
    EXPECT_EQ(client.receive(), Message{Disconnect{}});
    EXPECT_EQ(client.state(), SessionState::State::CLOSED);

    EXPECT_THROW(client.send(Greeting{}), ProtocolViolation);
    EXPECT_THROW(client.greet(), ProtocolViolation);
    EXPECT_THROW(client.receive(), ProtocolViolation);
    EXPECT_FALSE(client.close());
}

// Test that a Disconnect arriving in place of a GreetingResponse is reported
TEST(ClientTest, DisconnectDuringGreetIsViolation) {
    init_test_logging(boost::log::trivial::fatal);
    boost::asio::io_context io_context;
    auto streams = make_stream_pair(io_context);

    auto peer_side = std::async(std::launch::async, [stream = std::move(streams.second)]() mutable {
        return SecureChannel::establish(std::move(stream));
    });
    Client client(SecureChannel::establish(std::move(streams.first)));
    auto peer = peer_side.get();

    auto answering = std::async(std::launch::async, [&peer]() {
        peer->receive();
        peer->send(Disconnect{});
    });
    EXPECT_THROW(client.greet(), ProtocolViolation);
    answering.get();
    EXPECT_EQ(client.state(), SessionState::State::CLOSED);
}
