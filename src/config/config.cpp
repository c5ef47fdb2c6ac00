#include "config/config.hpp"
#include "core/errors.hpp"
#include "logger/logger.hpp"
#include <limits>
#include <ostream>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace config {

namespace {

uint64_t parse_number(const std::string& flag, const std::string& value, uint64_t max) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw core::ValidationError("invalid number for " + flag + ": " + value);
  }
  try {
    unsigned long long parsed = std::stoull(value);
    if (parsed > max) {
      throw core::ValidationError("value out of range for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::out_of_range&) {
    throw core::ValidationError("value out of range for " + flag + ": " + value);
  }
}

enum class Flag {
  Host, Port, Catalog, BackendHost, BackendPort, BackendSecret, MaxRetries,
  TransferUnit, MultiClient, PoolSize, IdentityHeader, CacheTtl, LogFile, LogLevel
};

} // namespace

//==============================================
// VALIDATION
//==============================================

void ServerConfig::validate() const {
  if (host.empty()) {
    throw core::ValidationError("listen host is required");
  }
  if (catalog_path.empty()) {
    throw core::ValidationError("--catalog is required");
  }
  if (backend_host.empty()) {
    throw core::ValidationError("--backend-host is required");
  }
  if (backend_port == 0) {
    throw core::ValidationError("backend port must be non-zero");
  }
  if (transfer_unit == 0 || transfer_unit > kMaxTransferUnit ||
      transfer_unit % kTransferUnitAlignment != 0) {
    throw core::ValidationError("transfer unit must be a multiple of 4096 up to 1048576, got " +
                                std::to_string(transfer_unit));
  }
  if (multi_client && pool_size == 0) {
    throw core::ValidationError("pool size must be at least 1 in multi-client mode");
  }
  if (identity_header.empty()) {
    throw core::ValidationError("identity header name must not be empty");
  }
  logger::parse_severity(log_level);
}


//==============================================
// COMMAND LINE PARSING
//==============================================

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " --catalog <file> --backend-host <host> [options]\n"
      << "Required arguments:\n"
      << "  --catalog <file>          JSON file catalog\n"
      << "  --backend-host <host>     Blob backend host\n"
      << "Options:\n"
      << "  -h, --host <addr>         Listen address (default 0.0.0.0)\n"
      << "  -p, --port <port>         Listen port (default 8080)\n"
      << "  --backend-port <port>     Blob backend port (default 80)\n"
      << "  --backend-secret <key>    HMAC secret for backend requests\n"
      << "  --max-retries <n>         Retries on backend rate limiting (default 3)\n"
      << "  --transfer-unit <bytes>   Bytes per remote fetch (default 1048576)\n"
      << "  --multi-client            Use a shared pool of backend clients\n"
      << "  --pool-size <n>           Shared pool size (default 4)\n"
      << "  --identity-header <name>  Header carrying the caller identity (default X-Session-Token)\n"
      << "  --cache-ttl <seconds>     Metadata cache lifetime, 0 = forever (default 300)\n"
      << "  --log-file <file>         Also log to this file\n"
      << "  --log-level <level>       trace|debug|info|warning|error|fatal (default info)\n"
      << "Example: " << program_name
      << " --catalog files.json --backend-host 127.0.0.1 --backend-port 9000 -p 8080\n";
}

ServerConfig parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, Flag> flag_map = {
    {"-h", Flag::Host},
    {"--host", Flag::Host},
    {"-p", Flag::Port},
    {"--port", Flag::Port},
    {"--catalog", Flag::Catalog},
    {"--backend-host", Flag::BackendHost},
    {"--backend-port", Flag::BackendPort},
    {"--backend-secret", Flag::BackendSecret},
    {"--max-retries", Flag::MaxRetries},
    {"--transfer-unit", Flag::TransferUnit},
    {"--multi-client", Flag::MultiClient},
    {"--pool-size", Flag::PoolSize},
    {"--identity-header", Flag::IdentityHeader},
    {"--cache-ttl", Flag::CacheTtl},
    {"--log-file", Flag::LogFile},
    {"--log-level", Flag::LogLevel}
  };

  ServerConfig config;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);
    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      throw core::ValidationError("unknown argument: " + flag);
    }

    // The only switch without a value
    if (it->second == Flag::MultiClient) {
      config.multi_client = true;
      continue;
    }

    if (i + 1 >= argc) {
      throw core::ValidationError("missing value for " + flag);
    }
    const std::string value(argv[++i]);

    switch (it->second) {
      case Flag::Host:
        config.host = value;
        break;
      case Flag::Port:
        config.port = static_cast<uint16_t>(parse_number(flag, value, std::numeric_limits<uint16_t>::max()));
        break;
      case Flag::Catalog:
        config.catalog_path = value;
        break;
      case Flag::BackendHost:
        config.backend_host = value;
        break;
      case Flag::BackendPort:
        config.backend_port = static_cast<uint16_t>(parse_number(flag, value, std::numeric_limits<uint16_t>::max()));
        break;
      case Flag::BackendSecret:
        config.backend_secret = value;
        break;
      case Flag::MaxRetries:
        config.max_retries = static_cast<unsigned>(parse_number(flag, value, 100));
        break;
      case Flag::TransferUnit:
        config.transfer_unit = static_cast<std::size_t>(parse_number(flag, value, kMaxTransferUnit));
        break;
      case Flag::MultiClient:
        break;
      case Flag::PoolSize:
        config.pool_size = static_cast<std::size_t>(parse_number(flag, value, 1024));
        break;
      case Flag::IdentityHeader:
        config.identity_header = value;
        break;
      case Flag::CacheTtl:
        config.cache_ttl = std::chrono::seconds(parse_number(flag, value, 7 * 24 * 3600));
        break;
      case Flag::LogFile:
        config.log_file = value;
        break;
      case Flag::LogLevel:
        config.log_level = value;
        break;
    }
  }

  config.validate();
  BOOST_LOG_TRIVIAL(debug) << "Config: Parsed " << argc - 1 << " arguments";
  return config;
}

} // namespace config
} // namespace chunkstream
