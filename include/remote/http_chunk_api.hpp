#ifndef CHUNKSTREAM_REMOTE_HTTP_CHUNK_API_HPP
#define CHUNKSTREAM_REMOTE_HTTP_CHUNK_API_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "remote/chunk_api.hpp"
#include "remote/request_signer.hpp"

namespace chunkstream {
namespace remote {

struct BackendSettings {
  std::string host;
  uint16_t port{80};
  std::string secret;
  unsigned max_retries{3};
  std::chrono::seconds max_retry_wait{30};
};

// ChunkApi over the blob backend's HTTP/1.1 interface.
// Thread-safe: each call borrows a keep-alive connection from an idle list.
class HttpChunkApi : public ChunkApi {
public:
  HttpChunkApi(BackendSettings settings, std::string identity);
  ~HttpChunkApi() override;

  HttpChunkApi(const HttpChunkApi&) = delete;
  HttpChunkApi& operator=(const HttpChunkApi&) = delete;


  // ---- CHUNK API ----
  std::string identity() const override { return identity_; }
  FetchResult fetch(const DocumentLocation& location, std::uint64_t offset, std::uint32_t limit) override;
  ContainerHandle resolve_container(std::int64_t container_id) override;
  std::vector<MessageVariant> get_messages(const ContainerHandle& container,
                                           const std::vector<std::int32_t>& ids) override;


  // ---- RESPONSE DECODING ----
  // Exposed for tests; all throw core::UpstreamError on unexpected input
  static ContainerHandle decode_container(const nlohmann::json& tree);
  static MessageVariant decode_message(const nlohmann::json& tree);
  static std::string percent_encode(const std::string& value);
  // Seconds to wait for a Retry-After value, at most max_wait; 1s when absent
  // or not a plain number
  static std::chrono::seconds retry_delay(const std::string& retry_after, std::chrono::seconds max_wait);

private:
  using Connection = boost::beast::tcp_stream;
  using Response = boost::beast::http::response<boost::beast::http::vector_body<std::uint8_t>>;

  // ---- PARAMETERS ----
  BackendSettings settings_;
  std::string identity_;
  RequestSigner signer_;

  boost::asio::io_context io_context_;
  std::mutex mutex_;
  std::optional<boost::asio::ip::tcp::resolver::results_type> endpoints_;
  std::vector<std::unique_ptr<Connection>> idle_connections_;


  // ---- TRANSPORT ----
  // Sends a request, retrying rate-limited responses; returns any 2xx response
  Response perform(boost::beast::http::verb method, const std::string& target, const std::string& body = "");
  Response perform_once(const boost::beast::http::request<boost::beast::http::string_body>& request);
  std::unique_ptr<Connection> open_connection();
  std::unique_ptr<Connection> take_connection(bool& reused);
  void return_connection(std::unique_ptr<Connection> connection);

  nlohmann::json parse_json(const Response& response, const std::string& target) const;
};

} // namespace remote
} // namespace chunkstream

#endif // CHUNKSTREAM_REMOTE_HTTP_CHUNK_API_HPP
