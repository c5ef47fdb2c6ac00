#ifndef CHUNKSTREAM_STREAM_RESPONSE_SINK_HPP
#define CHUNKSTREAM_STREAM_RESPONSE_SINK_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace chunkstream {
namespace stream {

struct ResponseHead {
  unsigned status{200};
  std::uint64_t content_length{0};
  std::vector<std::pair<std::string, std::string>> headers;

  // Value of the first header with this name, empty if absent
  std::string header(const std::string& name) const {
    for (const auto& entry : headers) {
      if (entry.first == name) {
        return entry.second;
      }
    }
    return {};
  }

  bool has_header(const std::string& name) const {
    for (const auto& entry : headers) {
      if (entry.first == name) {
        return true;
      }
    }
    return false;
  }
};

// Write side of a response. send_head commits the status and headers; the
// body follows in order through write_body.
class ResponseSink {
public:
  virtual ~ResponseSink() = default;

  virtual void send_head(const ResponseHead& head) = 0;
  // False when the client is gone
  virtual bool write_body(const std::uint8_t* data, std::size_t size) = 0;
  // Body complete
  virtual void finish() = 0;
  // Drop the connection mid-body so the client sees an early EOF
  virtual void abort() = 0;
};

} // namespace stream
} // namespace chunkstream

#endif // CHUNKSTREAM_STREAM_RESPONSE_SINK_HPP
