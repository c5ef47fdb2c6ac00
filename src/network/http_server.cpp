#include "network/http_server.hpp"
#include "core/errors.hpp"
#include <optional>
#include <boost/beast/version.hpp>
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace network {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

const std::string kStreamPrefix = "/api/files/";
const std::string kStreamSuffix = "/stream";

// File id from /api/files/<id>/stream, empty when the path does not match
std::string stream_file_id(const std::string& path) {
  if (path.size() <= kStreamPrefix.size() + kStreamSuffix.size() ||
      path.compare(0, kStreamPrefix.size(), kStreamPrefix) != 0 ||
      path.compare(path.size() - kStreamSuffix.size(), kStreamSuffix.size(), kStreamSuffix) != 0) {
    return {};
  }
  std::string id = path.substr(kStreamPrefix.size(), path.size() - kStreamPrefix.size() - kStreamSuffix.size());
  if (id.find('/') != std::string::npos) {
    return {};
  }
  return id;
}

// ResponseSink over a Beast buffer_body serializer. HEAD responses carry the
// same header block with no body.
class BeastResponseSink : public stream::ResponseSink {
public:
  BeastResponseSink(tcp::socket& socket, unsigned version, bool keep_alive, bool head_only)
    : socket_(socket)
    , version_(version)
    , keep_alive_(keep_alive)
    , head_only_(head_only) {}

  void send_head(const stream::ResponseHead& head) override {
    committed_ = true;
    beast::error_code ec;

    if (head_only_) {
      http::response<http::empty_body> response{static_cast<http::status>(head.status), version_};
      fill(response, head);
      http::response_serializer<http::empty_body> serializer{response};
      http::write_header(socket_, serializer, ec);
    } else {
      response_.result(static_cast<http::status>(head.status));
      response_.version(version_);
      fill(response_, head);
      response_.body().data = nullptr;
      response_.body().more = true;
      serializer_.emplace(response_);
      http::write_header(socket_, *serializer_, ec);
    }

    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP server: Failed to write response head: " << ec.message();
      broken_ = true;
    }
  }

  bool write_body(const std::uint8_t* data, std::size_t size) override {
    if (broken_ || !serializer_) {
      return false;
    }
    response_.body().data = const_cast<std::uint8_t*>(data);
    response_.body().size = size;
    response_.body().more = true;

    beast::error_code ec;
    http::write(socket_, *serializer_, ec);
    if (ec == http::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(info) << "HTTP server: Client write failed: " << ec.message();
      broken_ = true;
      return false;
    }
    return true;
  }

  void finish() override {
    if (broken_ || !serializer_) {
      return;
    }
    response_.body().data = nullptr;
    response_.body().size = 0;
    response_.body().more = false;

    beast::error_code ec;
    http::write(socket_, *serializer_, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(info) << "HTTP server: Failed to finish response: " << ec.message();
      broken_ = true;
    }
  }

  void abort() override {
    broken_ = true;
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
  }

  bool committed() const { return committed_; }
  bool reusable() const { return keep_alive_ && !broken_; }

private:
  template <class Body>
  void fill(http::response<Body>& response, const stream::ResponseHead& head) const {
    response.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    for (const auto& entry : head.headers) {
      response.set(entry.first, entry.second);
    }
    response.content_length(head.content_length);
    response.keep_alive(keep_alive_);
  }

  tcp::socket& socket_;
  const unsigned version_;
  const bool keep_alive_;
  const bool head_only_;
  bool committed_{false};
  bool broken_{false};
  http::response<http::buffer_body> response_;
  std::optional<http::response_serializer<http::buffer_body>> serializer_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const std::string& address, std::uint16_t port, stream::StreamOrchestrator& orchestrator,
                       std::string identity_header)
  : address_(address)
  , port_(port)
  , bound_port_(port)
  , orchestrator_(orchestrator)
  , identity_header_(std::move(identity_header))
  , is_running_(false) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing on " << address_ << ":" << port_;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_, endpoint);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;
    start_accept();

    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<Socket>(io_context_);
  acceptor_->async_accept(*socket, [this, socket](const boost::system::error_code& error) {
    if (error) {
      if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
    } else {
      {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.insert(socket);
      }
      std::thread([this, socket]() mutable { run_session(std::move(socket)); }).detach();
    }
    start_accept();
  });
}

void HttpServer::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";
  is_running_ = false;

  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  // Unblock session reads and writes, then wait for every session to leave
  std::unique_lock<std::mutex> lock(sessions_mutex_);
  for (const auto& socket : sessions_) {
    boost::system::error_code ec;
    socket->shutdown(tcp::socket::shutdown_both, ec);
  }
  sessions_cv_.wait(lock, [this]() { return sessions_.empty(); });

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}


//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::run_session(std::shared_ptr<Socket> socket) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Session started";
  beast::flat_buffer buffer;

  while (is_running_) {
    Request request;
    beast::error_code ec;
    http::read(*socket, buffer, request, ec);
    if (ec == http::error::end_of_stream) {
      break;
    }
    if (ec) {
      if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Read failed: " << ec.message();
      }
      break;
    }

    if (!handle_request(*socket, request)) {
      break;
    }
  }

  beast::error_code ec;
  socket->shutdown(tcp::socket::shutdown_send, ec);
  socket->close(ec);
  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Session closed";

  // The socket must be gone before shutdown() can return
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.erase(socket);
  socket.reset();
  sessions_cv_.notify_all();
}

bool HttpServer::handle_request(Socket& socket, const Request& request) {
  std::string path(request.target());
  const auto query = path.find('?');
  if (query != std::string::npos) {
    path.erase(query);
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP server: " << request.method_string() << " " << path;

  if (path == "/healthz") {
    if (request.method() != http::verb::get && request.method() != http::verb::head) {
      return send_text(socket, request, 405, "method not allowed", "Allow", "GET, HEAD");
    }
    return send_text(socket, request, 200, "ok");
  }

  const std::string file_id = stream_file_id(path);
  if (file_id.empty()) {
    return send_text(socket, request, 404, "not found");
  }
  if (request.method() != http::verb::get && request.method() != http::verb::head) {
    return send_text(socket, request, 405, "method not allowed", "Allow", "GET, HEAD");
  }
  return handle_stream(socket, request, file_id);
}

bool HttpServer::handle_stream(Socket& socket, const Request& request, const std::string& file_id) {
  stream::StreamRequest stream_request;
  stream_request.file_id = file_id;
  stream_request.head_only = request.method() == http::verb::head;
  if (request.find(http::field::range) != request.end()) {
    stream_request.range_header = std::string(request[http::field::range]);
  }
  if (request.find(identity_header_) != request.end()) {
    stream_request.caller_identity = std::string(request[identity_header_]);
  }

  BeastResponseSink sink(socket, request.version(), request.keep_alive(), stream_request.head_only);

  try {
    const stream::StreamOutcome outcome = orchestrator_.serve(stream_request, sink);
    return outcome.completed && sink.reusable();
  } catch (const core::RangeNotSatisfiableError& e) {
    if (sink.committed()) {
      sink.abort();
      return false;
    }
    BOOST_LOG_TRIVIAL(info) << "HTTP server: " << e.what();
    return send_text(socket, request, 416, e.what(), "Content-Range",
                     "bytes */" + std::to_string(e.total_size()));
  } catch (const core::StreamError& e) {
    if (sink.committed()) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Stream failed after commit: " << e.what();
      sink.abort();
      return false;
    }

    unsigned status = 500;
    if (dynamic_cast<const core::ValidationError*>(&e)) {
      status = 400;
    } else if (dynamic_cast<const core::NotFoundError*>(&e)) {
      status = 404;
    } else if (dynamic_cast<const core::UnauthorizedError*>(&e)) {
      status = 401;
    } else if (dynamic_cast<const core::UpstreamError*>(&e)) {
      status = 502;
    }
    if (status >= 500) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: " << status << " for file " << file_id << ": " << e.what();
    } else {
      BOOST_LOG_TRIVIAL(info) << "HTTP server: " << status << " for file " << file_id << ": " << e.what();
    }
    return send_text(socket, request, status, e.what());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Internal error for file " << file_id << ": " << e.what();
    if (sink.committed()) {
      sink.abort();
      return false;
    }
    return send_text(socket, request, 500, "internal error");
  }
}

bool HttpServer::send_text(Socket& socket, const Request& request, unsigned status, const std::string& body,
                           const std::string& extra_name, const std::string& extra_value) {
  http::response<http::string_body> response{static_cast<http::status>(status), request.version()};
  response.set(http::field::server, BOOST_BEAST_VERSION_STRING);
  response.set(http::field::content_type, "text/plain");
  if (!extra_name.empty()) {
    response.set(extra_name, extra_value);
  }
  response.keep_alive(request.keep_alive());
  response.body() = body;
  response.prepare_payload();

  beast::error_code ec;
  if (request.method() == http::verb::head) {
    http::response_serializer<http::string_body> serializer{response};
    http::write_header(socket, serializer, ec);
  } else {
    http::write(socket, response, ec);
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(info) << "HTTP server: Failed to send " << status << ": " << ec.message();
    return false;
  }
  return request.keep_alive();
}

} // namespace network
} // namespace chunkstream
