#ifndef PNEUMATIC_NETWORK_TCP_STREAM_HPP
#define PNEUMATIC_NETWORK_TCP_STREAM_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio.hpp>
#include "stream.hpp"

namespace pneumatic {
namespace network {

class TCP_Stream : public Stream {
public:
    // Delete copy operations to prevent socket duplication
    TCP_Stream(const TCP_Stream&) = delete;
    TCP_Stream& operator=(const TCP_Stream&) = delete;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    // Wraps an accepted socket; its io_context must outlive the stream
    explicit TCP_Stream(boost::asio::ip::tcp::socket socket);
    ~TCP_Stream() override;

    // Resolves and connects to a remote host, owning its own io_context
    static std::unique_ptr<TCP_Stream> connect(const std::string& host, uint16_t port);


    // ---- DATA TRANSFER ----
    std::size_t write(const uint8_t* data, std::size_t size, boost::system::error_code& ec) override;
    std::size_t read(uint8_t* data, std::size_t size, boost::system::error_code& ec) override;


    // ---- TEARDOWN ----
    void close() override;


    // ---- GETTERS ----
    const std::string& remote_address() const override { return remote_address_; }

private:
    // ---- PARAMETERS ----
    // Only set for outbound streams
    std::unique_ptr<boost::asio::io_context> owned_context_;
    boost::asio::ip::tcp::socket socket_;
    std::string remote_address_;
    std::mutex close_mutex_;
    std::atomic<bool> closed_{false};

    TCP_Stream(std::unique_ptr<boost::asio::io_context> context, boost::asio::ip::tcp::socket socket);

    static std::string format_endpoint(const boost::asio::ip::tcp::socket& socket);
};

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_NETWORK_TCP_STREAM_HPP
