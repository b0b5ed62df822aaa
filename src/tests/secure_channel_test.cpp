#include <gtest/gtest.h>
#include "network/secure_channel.hpp"
#include "crypto/key_derivation.hpp"
#include "crypto/key_exchange.hpp"
#include "test_utils.hpp"
#include <algorithm>
#include <future>

using namespace pneumatic::network;
using pneumatic::testing::TamperingStream;

namespace {

// Handshake bytes written by each side before the first frame
constexpr std::size_t HANDSHAKE_SIZE =
    pneumatic::crypto::EphemeralKeyPair::PUBLIC_KEY_SIZE + pneumatic::crypto::SALT_SIZE;

// Answers the salt exchange with the peer's own salt
class SaltEchoStream : public Stream {
public:
    explicit SaltEchoStream(std::unique_ptr<Stream> inner) : inner_(std::move(inner)) {}

    std::size_t write(const uint8_t* data, std::size_t size, boost::system::error_code& ec) override {
        if (writes_++ != 1) {
            return inner_->write(data, size, ec);
        }
        // Second write is the salt: read the peer's first and send it back
        peer_salt_.resize(size);
        inner_->read(peer_salt_.data(), peer_salt_.size(), ec);
        if (ec) {
            return 0;
        }
        return inner_->write(peer_salt_.data(), peer_salt_.size(), ec);
    }

    std::size_t read(uint8_t* data, std::size_t size, boost::system::error_code& ec) override {
        if (!peer_salt_.empty() && size == peer_salt_.size()) {
            std::copy(peer_salt_.begin(), peer_salt_.end(), data);
            peer_salt_.clear();
            return size;
        }
        return inner_->read(data, size, ec);
    }

    void close() override { inner_->close(); }

    const std::string& remote_address() const override { return inner_->remote_address(); }

private:
    std::unique_ptr<Stream> inner_;
    std::vector<uint8_t> peer_salt_;
    int writes_ = 0;
};

} // namespace

class SecureChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging(boost::log::trivial::fatal);
    }

    // Establishes both ends concurrently, wrapping the client end if requested
    void connect_pair(std::function<std::unique_ptr<Stream>(std::unique_ptr<Stream>)> wrap_client = nullptr) {
        auto streams = make_stream_pair(io_context);
        std::unique_ptr<Stream> client_stream = std::move(streams.first);
        if (wrap_client) {
            client_stream = wrap_client(std::move(client_stream));
        }

        auto server_side = std::async(std::launch::async, [stream = std::move(streams.second)]() mutable {
            return SecureChannel::establish(std::move(stream));
        });
        client = SecureChannel::establish(std::move(client_stream));
        server = server_side.get();
    }

    boost::asio::io_context io_context;
    std::unique_ptr<SecureChannel> client;
    std::unique_ptr<SecureChannel> server;
};

TEST_F(SecureChannelTest, HandshakeProducesMirroredKeys) {
    auto streams = make_stream_pair(io_context);
    Stream& left = *streams.first;
    Stream& right = *streams.second;

    auto right_keys = std::async(std::launch::async, [&right]() {
        return SecureChannel::handshake(right);
    });
    const ChannelKeys left_keys = SecureChannel::handshake(left);
    const ChannelKeys peer_keys = right_keys.get();

    EXPECT_EQ(left_keys.encrypt_key, peer_keys.decrypt_key);
    EXPECT_EQ(left_keys.decrypt_key, peer_keys.encrypt_key);
    EXPECT_NE(left_keys.encrypt_key, left_keys.decrypt_key);
}

// Test that messages arrive intact and in order in both directions
TEST_F(SecureChannelTest, MessagesRoundTripInOrder) {
    connect_pair();

    const std::vector<Message> sequence = {
        Greeting{1},
        GreetingResponse{GreetingStatus::PROTOCOL_OK},
        Greeting{42},
        GreetingResponse{GreetingStatus::UNSUPPORTED_PROTOCOL},
        Disconnect{}
    };

    for (const auto& message : sequence) {
        client->send(message);
    }
    for (const auto& message : sequence) {
        EXPECT_EQ(server->receive(), message);
    }

    server->send(Disconnect{});
    EXPECT_EQ(client->receive(), Message{Disconnect{}});
}

TEST_F(SecureChannelTest, RawFramesRoundTrip) {
    connect_pair();

    const std::vector<uint8_t> empty;
    const std::vector<uint8_t> large(SecureChannel::MAX_FRAME_SIZE - pneumatic::crypto::AeadCipher::TAG_SIZE, 0xab);

    auto receiving = std::async(std::launch::async, [this]() {
        std::vector<std::vector<uint8_t>> frames;
        frames.push_back(server->receive_frame());
        frames.push_back(server->receive_frame());
        return frames;
    });
    client->send_frame(empty);
    client->send_frame(large);

    const auto frames = receiving.get();
    EXPECT_EQ(frames[0], empty);
    EXPECT_EQ(frames[1], large);
}

TEST_F(SecureChannelTest, OversizedPayloadRejected) {
    connect_pair();
    std::vector<uint8_t> payload(SecureChannel::MAX_FRAME_SIZE, 0);
    EXPECT_THROW(client->send_frame(payload), SerializationError);
}

// Test that flipping a ciphertext bit poisons the receiving channel
TEST_F(SecureChannelTest, TamperedFrameRejected) {
    const std::size_t first_body_byte = HANDSHAKE_SIZE + SecureChannel::LENGTH_PREFIX_SIZE;
    connect_pair([first_body_byte](std::unique_ptr<Stream> stream) {
        return std::make_unique<TamperingStream>(std::move(stream), first_body_byte + 2);
    });

    client->send(Greeting{1});
    EXPECT_THROW(server->receive(), FrameError);
    EXPECT_TRUE(server->is_poisoned());
    EXPECT_THROW(server->receive(), FrameError);
}

TEST_F(SecureChannelTest, TamperedTagRejected) {
    // Greeting frame body: 8 payload bytes then the tag
    const std::size_t tag_byte = HANDSHAKE_SIZE + SecureChannel::LENGTH_PREFIX_SIZE + 8 + 5;
    connect_pair([tag_byte](std::unique_ptr<Stream> stream) {
        return std::make_unique<TamperingStream>(std::move(stream), tag_byte);
    });

    client->send(Greeting{1});
    EXPECT_THROW(server->receive(), FrameError);
}

// Test that a length prefix grown by tampering ends in FrameError once the sender goes away
TEST_F(SecureChannelTest, TamperedLengthLowByteRejected) {
    // Greeting frame length is 24, the flip makes it 25
    const std::size_t low_length_byte = HANDSHAKE_SIZE + SecureChannel::LENGTH_PREFIX_SIZE - 1;
    connect_pair([low_length_byte](std::unique_ptr<Stream> stream) {
        return std::make_unique<TamperingStream>(std::move(stream), low_length_byte);
    });

    client->send(Greeting{1});
    client->close();
    EXPECT_THROW(server->receive(), FrameError);
    EXPECT_TRUE(server->is_poisoned());
}

TEST_F(SecureChannelTest, TamperedLengthHighByteRejected) {
    // Most significant byte set pushes the length past MAX_FRAME_SIZE
    connect_pair([](std::unique_ptr<Stream> stream) {
        return std::make_unique<TamperingStream>(std::move(stream), HANDSHAKE_SIZE);
    });

    client->send(Greeting{1});
    EXPECT_THROW(server->receive(), FrameError);
}

TEST_F(SecureChannelTest, TamperedPublicKeyFailsFirstFrame) {
    connect_pair([](std::unique_ptr<Stream> stream) {
        return std::make_unique<TamperingStream>(std::move(stream), 0);
    });

    client->send(Greeting{1});
    EXPECT_THROW(server->receive(), FrameError);
}

TEST_F(SecureChannelTest, CleanCloseReportsConnectionClosed) {
    connect_pair();
    client.reset();
    EXPECT_THROW(server->receive(), ConnectionClosedError);
}

// Test that a peer reflecting our salt is refused
TEST_F(SecureChannelTest, EchoedSaltRejected) {
    auto streams = make_stream_pair(io_context);
    auto echoing = std::make_unique<SaltEchoStream>(std::move(streams.first));

    auto honest = std::async(std::launch::async, [stream = std::move(streams.second)]() mutable {
        SecureChannel::establish(std::move(stream));
    });

    // The reflecting side never sees its own salt and completes its half
    auto reflecting = SecureChannel::establish(std::move(echoing));
    EXPECT_THROW(honest.get(), HandshakeError);
}

TEST_F(SecureChannelTest, PeerVanishingDuringHandshake) {
    auto streams = make_stream_pair(io_context);
    streams.second->close();
    streams.second.reset();

    EXPECT_THROW(SecureChannel::establish(std::move(streams.first)), HandshakeError);
}
