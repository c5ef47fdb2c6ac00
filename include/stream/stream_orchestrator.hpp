#ifndef CHUNKSTREAM_STREAM_STREAM_ORCHESTRATOR_HPP
#define CHUNKSTREAM_STREAM_STREAM_ORCHESTRATOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "metadata/part_resolver.hpp"
#include "pool/client_pool.hpp"
#include "stream/byte_pipe.hpp"
#include "stream/response_sink.hpp"

namespace chunkstream {
namespace stream {

struct StreamRequest {
  std::string file_id;
  std::optional<std::string> range_header;
  bool head_only{false};
  std::string caller_identity;
};

struct StreamOutcome {
  unsigned status{0};
  std::uint64_t content_length{0};
  std::uint64_t bytes_sent{0};
  bool completed{false};
  bool client_cancelled{false};
};

/**
 * Serves one GET or HEAD of a file's byte window.
 *
 * Everything that can fail before the response head is committed (unknown
 * file, bad range, metadata resolution, the first chunk fetch) is thrown as a
 * core::StreamError subclass for the caller to turn into an error status.
 * Failures after the commit abort the sink and are reported in the outcome.
 */
class StreamOrchestrator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  StreamOrchestrator(metadata::PartResolver& resolver, pool::ClientPool& pool, std::size_t transfer_unit);


  // ---- REQUEST PROCESSING ----
  StreamOutcome serve(const StreamRequest& request, ResponseSink& sink);

  // Status and headers for a record; range is empty for zero-length files
  static ResponseHead build_head(const core::FileRecord& record,
                                 const std::optional<core::ByteRange>& range,
                                 bool partial);

private:
  // ---- PARAMETERS ----
  metadata::PartResolver& resolver_;
  pool::ClientPool& pool_;
  std::size_t transfer_unit_;


  // ---- STREAMING ----
  // Producer body: streams the parts in order into the pipe, then closes it
  // (with the error on failure). Stops before the next fetch once the
  // reader has cancelled.
  void produce(remote::ChunkApi& api, const std::vector<core::Part>& parts, BytePipe& pipe) const;
  // Drains the pipe into the committed sink
  void deliver(BytePipe& pipe, core::Bytes first_chunk, ResponseSink& sink, StreamOutcome& outcome) const;
};

} // namespace stream
} // namespace chunkstream

#endif // CHUNKSTREAM_STREAM_STREAM_ORCHESTRATOR_HPP
