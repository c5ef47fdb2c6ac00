#include "config/config.hpp"
#include "core/errors.hpp"
#include "logger/logger.hpp"
#include "metadata/json_file_catalog.hpp"
#include "metadata/metadata_cache.hpp"
#include "metadata/part_resolver.hpp"
#include "network/http_server.hpp"
#include "pool/client_pool.hpp"
#include "remote/http_chunk_api.hpp"
#include "stream/stream_orchestrator.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>

using namespace chunkstream;

namespace {

bool run_server(const config::ServerConfig& config) {
  try {
    metadata::JsonFileCatalog catalog(config.catalog_path);
    metadata::MetadataCache cache(config.cache_ttl);
    metadata::PartResolver resolver(catalog, cache);

    remote::BackendSettings backend;
    backend.host = config.backend_host;
    backend.port = config.backend_port;
    backend.secret = config.backend_secret;
    backend.max_retries = config.max_retries;

    pool::ClientPool clients(config.multi_client ? pool::PoolMode::Shared : pool::PoolMode::Dedicated,
                             config.pool_size,
                             [backend](const std::string& identity) {
                               return std::make_shared<remote::HttpChunkApi>(backend, identity);
                             });

    stream::StreamOrchestrator orchestrator(resolver, clients, config.transfer_unit);
    network::HttpServer server(config.host, config.port, orchestrator, config.identity_header);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start HTTP server\n";
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number << ", shutting down";
      }
    });
    signals_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  config::ServerConfig options;
  try {
    options = config::parse_command_line(argc, argv);
    logger::init_logging(options.log_file, logger::parse_severity(options.log_level));
  } catch (const core::ValidationError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    config::print_usage(std::cerr, argv[0]);
    return 1;
  }

  return run_server(options) ? 0 : 1;
}
