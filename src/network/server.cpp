#include "network/server.hpp"
#include "network/tcp_stream.hpp"
#include <boost/log/trivial.hpp>

namespace pneumatic {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Server::Server(const std::string& address, uint16_t port, UnsupportedProtocolPolicy policy)
  : address_(address)
  , port_(port)
  , policy_(policy) {
  BOOST_LOG_TRIVIAL(info) << "Server: Initializing server on " << address << ":" << port;
}

Server::~Server() {
  shutdown();
}

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool Server::start_listener() {
  if (is_started_) {
    BOOST_LOG_TRIVIAL(warning) << "Server: Server already started";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    io_context_.restart();
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_, endpoint);
    bound_port_ = acceptor_->local_endpoint().port();

    is_started_ = true;
    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "Server: Starting to accept connections";
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        // Stops accepting; shutdown() still joins what was started
        BOOST_LOG_TRIVIAL(error) << "Server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "Server: Server started successfully on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Server: Failed to start server: " << e.what();
    is_running_ = false;
    is_started_ = false;
    acceptor_.reset();
    return false;
  }
}

void Server::shutdown() {
  if (!is_started_.exchange(false)) {
    return;
  }
  is_running_ = false;

  BOOST_LOG_TRIVIAL(info) << "Server: Initiating server shutdown";

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();

  // Unblock every handler, then wait for each to deregister its session
  registry_.close_all();

  std::map<std::thread::id, std::thread> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers.swap(handlers_);
  }
  for (auto& handler : handlers) {
    if (handler.second.joinable()) {
      handler.second.join();
    }
  }
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    finished_handlers_.clear();
  }

  BOOST_LOG_TRIVIAL(info) << "Server: Server shutdown complete, " << registry_.size() << " sessions left";
}

//==============================================
// CONNECTION ACCEPTANCE
//==============================================

void Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (error == boost::asio::error::operation_aborted) {
        return;  // Acceptor closed by shutdown
      }
      if (!error) {
        register_session(std::move(*socket));
      } else {
        BOOST_LOG_TRIVIAL(error) << "Server: Accept error: " << error.message();
      }
      reap_handlers();
      start_accept();  // Continue accepting new connections
    });
}

void Server::register_session(boost::asio::ip::tcp::socket socket) {
  auto stream = std::make_unique<TCP_Stream>(std::move(socket));
  const std::string address = stream->remote_address();

  BOOST_LOG_TRIVIAL(info) << "Server: Connection received from " << address;

  auto session = std::make_shared<Session>(address, std::move(stream));

  // Visible to registry queries before the handler runs
  if (!registry_.insert(session)) {
    BOOST_LOG_TRIVIAL(warning) << "Server: Rejecting duplicate connection from " << address;
    session->close();
    return;
  }

  try {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    std::thread handler(&Server::handle_session, this, session);
    const std::thread::id id = handler.get_id();
    handlers_.emplace(id, std::move(handler));
  } catch (const std::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Server: Failed to spawn handler for " << address << ": " << e.what();
    session->close();
    finish_session(session);
  }
}

//==============================================
// SESSION HANDLING
//==============================================

void Server::handle_session(std::shared_ptr<Session> session) {
  const std::string& address = session->address();

  try {
    session->establish();
    session->serve(policy_);
  }
  catch (const HandshakeError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Server: " << address << ": " << e.what();
  }
  catch (const FrameError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Server: Dropping " << address << ": " << e.what();
  }
  catch (const ConnectionClosedError& e) {
    BOOST_LOG_TRIVIAL(info) << "Server: " << address << " went away: " << e.what();
  }
  catch (const NetworkException& e) {
    BOOST_LOG_TRIVIAL(warning) << "Server: Ending session with " << address << ": " << e.what();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Server: Unexpected error in session with " << address << ": " << e.what();
  }

  session->close();
  finish_session(session);

  std::lock_guard<std::mutex> lock(handlers_mutex_);
  finished_handlers_.push_back(std::this_thread::get_id());
}

void Server::finish_session(const std::shared_ptr<Session>& session) {
  if (session->mark_finished()) {
    registry_.remove(session->address());
  }
}

void Server::reap_handlers() {
  std::lock_guard<std::mutex> lock(handlers_mutex_);

  for (const auto& id : finished_handlers_) {
    auto it = handlers_.find(id);
    if (it != handlers_.end()) {
      if (it->second.joinable()) {
        it->second.join();
      }
      handlers_.erase(it);
    }
  }
  finished_handlers_.clear();
}

} // namespace network
} // namespace pneumatic
