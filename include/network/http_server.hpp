#ifndef CHUNKSTREAM_NETWORK_HTTP_SERVER_HPP
#define CHUNKSTREAM_NETWORK_HTTP_SERVER_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "stream/stream_orchestrator.hpp"

namespace chunkstream {
namespace network {

/**
 * HTTP front end for the stream orchestrator.
 *
 * The acceptor runs on its own io_context thread; every accepted connection
 * is handed to a session thread that reads requests synchronously and keeps
 * the connection alive between them.
 *
 * Routes:
 *   GET|HEAD /api/files/<id>/stream   stream a file or a byte range of it
 *   GET      /healthz                 liveness probe
 */
class HttpServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const std::string& address, std::uint16_t port, stream::StreamOrchestrator& orchestrator,
             std::string identity_header);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting, closes open sessions and waits for their threads
  void shutdown();


  // ---- GETTERS ----
  // Bound port, the ephemeral one when constructed with port 0
  std::uint16_t port() const { return bound_port_; }
  bool is_running() const { return is_running_; }

private:
  using Socket = boost::asio::ip::tcp::socket;
  using Request = boost::beast::http::request<boost::beast::http::string_body>;

  // ---- PARAMETERS ----
  const std::string address_;
  const std::uint16_t port_;
  std::uint16_t bound_port_;
  stream::StreamOrchestrator& orchestrator_;
  const std::string identity_header_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Open sessions; each session thread removes its own socket when done
  std::mutex sessions_mutex_;
  std::condition_variable sessions_cv_;
  std::set<std::shared_ptr<Socket>> sessions_;


  // ---- CONNECTION HANDLING ----
  void start_accept();
  void run_session(std::shared_ptr<Socket> socket);
  // Returns true when the connection can take another request
  bool handle_request(Socket& socket, const Request& request);
  bool handle_stream(Socket& socket, const Request& request, const std::string& file_id);
  bool send_text(Socket& socket, const Request& request, unsigned status, const std::string& body,
                 const std::string& extra_name = "", const std::string& extra_value = "");
};

} // namespace network
} // namespace chunkstream

#endif // CHUNKSTREAM_NETWORK_HTTP_SERVER_HPP
