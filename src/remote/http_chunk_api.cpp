#include "remote/http_chunk_api.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>
#include <boost/beast/version.hpp>
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace remote {

namespace beast = boost::beast;
namespace http = beast::http;
using json = nlohmann::json;

namespace {

constexpr std::uint64_t kMaxResponseBody = 64ULL * 1024 * 1024;

DocumentVariant decode_document(const json& tree) {
  const auto type = tree.at("type").get<std::string>();
  if (type == "document") {
    Document document;
    document.location.id = tree.at("id").get<std::int64_t>();
    document.location.access_hash = tree.at("access_hash").get<std::int64_t>();
    document.location.file_reference = tree.value("file_reference", std::string());
    document.size = tree.at("size").get<std::uint64_t>();
    document.mime_type = tree.value("mime_type", std::string());
    return document;
  }
  if (type == "empty") {
    return DocumentEmpty{tree.value("id", std::int64_t{0})};
  }
  throw core::UpstreamError("unknown document type: " + type);
}

MediaVariant decode_media(const json& tree) {
  const auto type = tree.at("type").get<std::string>();
  if (type == "document") {
    return MediaDocument{decode_document(tree.at("document"))};
  }
  if (type == "photo") {
    return MediaPhoto{tree.value("photo_id", std::int64_t{0})};
  }
  if (type == "empty") {
    return MediaEmpty{};
  }
  throw core::UpstreamError("unknown media type: " + type);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpChunkApi::HttpChunkApi(BackendSettings settings, std::string identity)
  : settings_(std::move(settings))
  , identity_(std::move(identity))
  , signer_(settings_.secret) {
  BOOST_LOG_TRIVIAL(info) << "Chunk client: Created client " << RequestSigner::fingerprint(identity_) << " for "
                          << settings_.host << ":" << settings_.port;
}

HttpChunkApi::~HttpChunkApi() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& connection : idle_connections_) {
    beast::error_code ec;
    connection->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
  idle_connections_.clear();
}


//==============================================
// CHUNK API
//==============================================

FetchResult HttpChunkApi::fetch(const DocumentLocation& location, std::uint64_t offset, std::uint32_t limit) {
  std::ostringstream target;
  target << "/v1/documents/" << location.id << "/content"
         << "?access_hash=" << location.access_hash
         << "&file_reference=" << percent_encode(location.file_reference)
         << "&offset=" << offset
         << "&limit=" << limit;

  BOOST_LOG_TRIVIAL(trace) << "Chunk client: Fetching document " << location.id
                           << " offset " << offset << " limit " << limit;

  Response response = perform(http::verb::get, target.str());

  const std::string content_type(response[http::field::content_type]);
  if (content_type.rfind("application/json", 0) == 0) {
    json tree = parse_json(response, target.str());
    const auto type = tree.value("type", std::string());
    if (type == "cdn_redirect") {
      return FileCdnRedirect{tree.value("dc_id", std::int32_t{0})};
    }
    throw core::UpstreamError("unexpected fetch response type '" + type + "' for document " +
                              std::to_string(location.id));
  }

  return FilePayload{std::move(response.body())};
}

ContainerHandle HttpChunkApi::resolve_container(std::int64_t container_id) {
  const std::string target = "/v1/containers/" + std::to_string(container_id);
  BOOST_LOG_TRIVIAL(debug) << "Chunk client: Resolving container " << container_id;

  Response response = perform(http::verb::get, target);
  return decode_container(parse_json(response, target));
}

std::vector<MessageVariant> HttpChunkApi::get_messages(const ContainerHandle& container,
                                                       const std::vector<std::int32_t>& ids) {
  const std::string target = "/v1/containers/" + std::to_string(container.id) + "/messages";

  const json body = {{"access_hash", container.access_hash}, {"ids", ids}};

  BOOST_LOG_TRIVIAL(debug) << "Chunk client: Requesting " << ids.size() << " messages from container "
                           << container.id;

  Response response = perform(http::verb::post, target, body.dump());
  json tree = parse_json(response, target);

  std::vector<MessageVariant> messages;
  try {
    for (const auto& child : tree.at("messages")) {
      messages.push_back(decode_message(child));
    }
  } catch (const json::exception& e) {
    throw core::UpstreamError("malformed messages response: " + std::string(e.what()));
  }
  return messages;
}


//==============================================
// RESPONSE DECODING
//==============================================

ContainerHandle HttpChunkApi::decode_container(const json& tree) {
  try {
    ContainerHandle handle;
    handle.id = tree.at("id").get<std::int64_t>();
    handle.access_hash = tree.at("access_hash").get<std::int64_t>();
    return handle;
  } catch (const json::exception& e) {
    throw core::UpstreamError("malformed container response: " + std::string(e.what()));
  }
}

MessageVariant HttpChunkApi::decode_message(const json& tree) {
  try {
    const auto type = tree.at("type").get<std::string>();
    const auto id = tree.at("id").get<std::int32_t>();

    if (type == "message") {
      return Message{id, tree.contains("media") ? decode_media(tree.at("media")) : MediaVariant{MediaEmpty{}}};
    }
    if (type == "empty") {
      return MessageEmpty{id};
    }
    if (type == "service") {
      return MessageService{id, tree.value("action", std::string())};
    }
    throw core::UpstreamError("unknown message type: " + type);
  } catch (const json::exception& e) {
    throw core::UpstreamError("malformed message: " + std::string(e.what()));
  }
}

std::chrono::seconds HttpChunkApi::retry_delay(const std::string& retry_after, std::chrono::seconds max_wait) {
  std::chrono::seconds wait{1};
  if (!retry_after.empty() && retry_after.find_first_not_of("0123456789") == std::string::npos) {
    const auto digits = retry_after.find_first_not_of('0');
    const std::string value = digits == std::string::npos ? "0" : retry_after.substr(digits);
    // Anything past nine digits is longer than any sensible cap
    wait = value.size() > 9 ? max_wait : std::chrono::seconds(std::stoll(value));
  }
  return std::min(wait, max_wait);
}

std::string HttpChunkApi::percent_encode(const std::string& value) {
  static const char hex[] = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded += static_cast<char>(c);
    } else {
      encoded += '%';
      encoded += hex[c >> 4];
      encoded += hex[c & 0x0F];
    }
  }
  return encoded;
}


//==============================================
// TRANSPORT
//==============================================

HttpChunkApi::Response HttpChunkApi::perform(http::verb method, const std::string& target,
                                             const std::string& body) {
  for (unsigned attempt = 0;; ++attempt) {
    http::request<http::string_body> request{method, target, 11};
    request.set(http::field::host, settings_.host);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.keep_alive(true);

    const std::string date = RequestSigner::http_date();
    request.set("X-Session", identity_);
    request.set("X-Date", date);
    if (signer_.enabled()) {
      request.set("X-Signature", signer_.sign(std::string(http::to_string(method)), target, date));
    }
    if (!body.empty()) {
      request.set(http::field::content_type, "application/json");
      request.body() = body;
    }
    request.prepare_payload();

    Response response;
    try {
      response = perform_once(request);
    } catch (const boost::system::system_error& e) {
      BOOST_LOG_TRIVIAL(error) << "Chunk client: Request " << target << " failed: " << e.what();
      throw core::UpstreamError("request to " + target + " failed: " + e.what());
    }

    const unsigned status = response.result_int();
    if (status == 429 && attempt < settings_.max_retries) {
      const auto wait = retry_delay(std::string(response[http::field::retry_after]), settings_.max_retry_wait);
      BOOST_LOG_TRIVIAL(warning) << "Chunk client: Rate limited on " << target << ", retrying in "
                                 << wait.count() << "s (attempt " << attempt + 1 << "/"
                                 << settings_.max_retries << ")";
      std::this_thread::sleep_for(wait);
      continue;
    }

    if (status < 200 || status >= 300) {
      BOOST_LOG_TRIVIAL(error) << "Chunk client: Backend returned " << status << " for " << target;
      throw core::UpstreamError("backend returned " + std::to_string(status) + " for " + target);
    }
    return response;
  }
}

HttpChunkApi::Response HttpChunkApi::perform_once(const http::request<http::string_body>& request) {
  bool reused = false;
  auto connection = take_connection(reused);

  auto exchange = [&request](Connection& stream) {
    http::write(stream, request);

    beast::flat_buffer buffer;
    http::response_parser<http::vector_body<std::uint8_t>> parser;
    parser.body_limit(kMaxResponseBody);
    http::read(stream, buffer, parser);
    return parser.release();
  };

  Response response;
  try {
    response = exchange(*connection);
  } catch (const boost::system::system_error& e) {
    if (!reused) {
      throw;
    }
    // Idle keep-alive connection went stale; one fresh attempt
    BOOST_LOG_TRIVIAL(debug) << "Chunk client: Stale connection (" << e.what() << "), reconnecting";
    connection = open_connection();
    response = exchange(*connection);
  }

  if (response.keep_alive()) {
    return_connection(std::move(connection));
  }
  return response;
}

std::unique_ptr<HttpChunkApi::Connection> HttpChunkApi::open_connection() {
  boost::asio::ip::tcp::resolver::results_type endpoints;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!endpoints_) {
      boost::asio::ip::tcp::resolver resolver(io_context_);
      endpoints_ = resolver.resolve(settings_.host, std::to_string(settings_.port));
    }
    endpoints = *endpoints_;
  }

  auto connection = std::make_unique<Connection>(io_context_);
  connection->connect(endpoints);
  BOOST_LOG_TRIVIAL(debug) << "Chunk client: Connected to " << settings_.host << ":" << settings_.port;
  return connection;
}

std::unique_ptr<HttpChunkApi::Connection> HttpChunkApi::take_connection(bool& reused) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!idle_connections_.empty()) {
      auto connection = std::move(idle_connections_.back());
      idle_connections_.pop_back();
      reused = true;
      return connection;
    }
  }
  reused = false;
  return open_connection();
}

void HttpChunkApi::return_connection(std::unique_ptr<Connection> connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  idle_connections_.push_back(std::move(connection));
}

nlohmann::json HttpChunkApi::parse_json(const Response& response, const std::string& target) const {
  try {
    return json::parse(response.body().begin(), response.body().end());
  } catch (const json::parse_error& e) {
    throw core::UpstreamError("invalid JSON from " + target + ": " + e.what());
  }
}

} // namespace remote
} // namespace chunkstream
