#ifndef CHUNKSTREAM_CONFIG_HPP
#define CHUNKSTREAM_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace chunkstream {
namespace config {

constexpr std::size_t kDefaultTransferUnit = 1024 * 1024;
constexpr std::size_t kMaxTransferUnit = 1024 * 1024;
constexpr std::size_t kTransferUnitAlignment = 4096;

struct ServerConfig {
  // Listener
  std::string host{"0.0.0.0"};
  uint16_t port{8080};

  // Metadata store
  std::string catalog_path;

  // Blob backend
  std::string backend_host;
  uint16_t backend_port{80};
  std::string backend_secret;
  unsigned max_retries{3};

  // Streaming
  std::size_t transfer_unit{kDefaultTransferUnit};
  bool multi_client{false};
  std::size_t pool_size{4};
  std::string identity_header{"X-Session-Token"};
  std::chrono::seconds cache_ttl{300};

  // Logging
  std::string log_file;
  std::string log_level{"info"};

  // Throws core::ValidationError describing the first invalid field
  void validate() const;
};

// Fills a ServerConfig from command-line flags and validates it.
// Throws core::ValidationError on unknown flags, bad values or missing
// required fields.
ServerConfig parse_command_line(int argc, char* argv[]);

void print_usage(std::ostream& out, const std::string& program_name);

} // namespace config
} // namespace chunkstream

#endif // CHUNKSTREAM_CONFIG_HPP
