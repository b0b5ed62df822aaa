#include "network/tcp_stream.hpp"
#include <boost/log/trivial.hpp>

namespace pneumatic {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Stream::TCP_Stream(boost::asio::ip::tcp::socket socket)
  : socket_(std::move(socket))
  , remote_address_(format_endpoint(socket_)) {
  BOOST_LOG_TRIVIAL(debug) << "TCP stream: Wrapped accepted socket from " << remote_address_;
}

TCP_Stream::TCP_Stream(std::unique_ptr<boost::asio::io_context> context, boost::asio::ip::tcp::socket socket)
  : owned_context_(std::move(context))
  , socket_(std::move(socket))
  , remote_address_(format_endpoint(socket_)) {
  BOOST_LOG_TRIVIAL(debug) << "TCP stream: Connected to " << remote_address_;
}

TCP_Stream::~TCP_Stream() {
  close();
  boost::system::error_code ec;
  socket_.close(ec);
}

std::unique_ptr<TCP_Stream> TCP_Stream::connect(const std::string& host, uint16_t port) {
  auto context = std::make_unique<boost::asio::io_context>();

  BOOST_LOG_TRIVIAL(info) << "TCP stream: Resolving " << host << ":" << port;

  // Resolve remote address to endpoints
  boost::asio::ip::tcp::resolver resolver(*context);
  auto endpoints = resolver.resolve(host, std::to_string(port));

  // Connect to the first available endpoint
  boost::asio::ip::tcp::socket socket(*context);
  boost::asio::connect(socket, endpoints);

  socket.set_option(boost::asio::ip::tcp::no_delay(true));

  return std::unique_ptr<TCP_Stream>(new TCP_Stream(std::move(context), std::move(socket)));
}

//==============================================
// DATA TRANSFER
//==============================================

std::size_t TCP_Stream::write(const uint8_t* data, std::size_t size, boost::system::error_code& ec) {
  return boost::asio::write(socket_, boost::asio::buffer(data, size), ec);
}

std::size_t TCP_Stream::read(uint8_t* data, std::size_t size, boost::system::error_code& ec) {
  return boost::asio::read(socket_, boost::asio::buffer(data, size), ec);
}

//==============================================
// TEARDOWN
//==============================================

void TCP_Stream::close() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  if (closed_.exchange(true)) {
    return;
  }

  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "TCP stream: Shutdown of " << remote_address_ << " reported: " << ec.message();
  }
  BOOST_LOG_TRIVIAL(debug) << "TCP stream: Closed stream to " << remote_address_;
}

std::string TCP_Stream::format_endpoint(const boost::asio::ip::tcp::socket& socket) {
  boost::system::error_code ec;
  auto endpoint = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace network
} // namespace pneumatic
