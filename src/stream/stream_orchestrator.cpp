#include "stream/stream_orchestrator.hpp"
#include "core/errors.hpp"
#include "stream/part_streamer.hpp"
#include "stream/range_header.hpp"
#include "stream/range_slicer.hpp"
#include <thread>
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace stream {

namespace {

// Quoted-string safe file name for Content-Disposition
std::string quote_filename(const std::string& name) {
  std::string quoted;
  quoted.reserve(name.size());
  for (char c : name) {
    if (c == '\r' || c == '\n') {
      continue;
    }
    if (c == '"' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  return quoted;
}

bool has_range(const std::optional<std::string>& header) {
  return header && header->find_first_not_of(" \t") != std::string::npos;
}

// Cancels the pipe and joins the producer on every exit path
class ProducerGuard {
public:
  ProducerGuard(std::thread& thread, BytePipe& pipe) : thread_(thread), pipe_(pipe) {}
  ~ProducerGuard() {
    pipe_.cancel();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

private:
  std::thread& thread_;
  BytePipe& pipe_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

StreamOrchestrator::StreamOrchestrator(metadata::PartResolver& resolver, pool::ClientPool& pool,
                                       std::size_t transfer_unit)
  : resolver_(resolver)
  , pool_(pool)
  , transfer_unit_(transfer_unit) {
  if (transfer_unit_ == 0) {
    throw core::ValidationError("transfer unit must be positive");
  }
  BOOST_LOG_TRIVIAL(info) << "Stream orchestrator: Initialized with transfer unit " << transfer_unit_;
}


//==============================================
// REQUEST PROCESSING
//==============================================

ResponseHead StreamOrchestrator::build_head(const core::FileRecord& record,
                                            const std::optional<core::ByteRange>& range,
                                            bool partial) {
  ResponseHead head;
  head.status = partial ? 206 : 200;
  head.content_length = range ? range->length() : 0;

  head.headers.emplace_back("Accept-Ranges", "bytes");
  if (partial && range) {
    head.headers.emplace_back("Content-Range", "bytes " + std::to_string(range->start) + "-" +
                                               std::to_string(range->end) + "/" + std::to_string(record.size));
  }
  head.headers.emplace_back("Content-Type", record.mime_type.empty() ? "application/octet-stream" : record.mime_type);
  head.headers.emplace_back("Content-Length", std::to_string(head.content_length));
  head.headers.emplace_back("Content-Disposition", "inline; filename=\"" + quote_filename(record.name) + "\"");
  return head;
}

StreamOutcome StreamOrchestrator::serve(const StreamRequest& request, ResponseSink& sink) {
  // Held until the stream ends, whichever way it ends
  pool::WorkloadLease lease = pool_.acquire(request.caller_identity);

  core::FileRecord record = resolver_.resolve_file(request.file_id);

  const bool partial = has_range(request.range_header);
  std::optional<core::ByteRange> range;
  if (partial) {
    range = parse_range_header(*request.range_header, record.size);
  } else if (record.size > 0) {
    range = core::ByteRange{0, record.size - 1};
  }

  ResponseHead head = build_head(record, range, partial);

  StreamOutcome outcome;
  outcome.status = head.status;
  outcome.content_length = head.content_length;

  BOOST_LOG_TRIVIAL(info) << "Stream orchestrator: " << (request.head_only ? "HEAD" : "GET") << " file "
                          << record.id << " range "
                          << (range ? std::to_string(range->start) + "-" + std::to_string(range->end) : "none")
                          << " (" << head.content_length << " bytes) via " << lease.label();

  if (request.head_only || head.content_length == 0) {
    sink.send_head(head);
    sink.finish();
    outcome.completed = true;
    return outcome;
  }

  core::FileDescriptor descriptor = resolver_.resolve_descriptor(lease.api(), record);
  const std::vector<core::Part> parts = slice_parts(descriptor.parts, *range);

  // Capacity of about one transfer unit bounds memory per stream
  BytePipe pipe(transfer_unit_);
  remote::ChunkApi& api = lease.api();
  std::thread producer([this, &api, &parts, &pipe]() { produce(api, parts, pipe); });
  ProducerGuard guard(producer, pipe);

  // Pull the first chunk before committing so an early upstream failure
  // still becomes an error status
  core::Bytes first_chunk;
  if (!pipe.read(first_chunk)) {
    throw core::PartialTransferError("no bytes produced for file " + record.id);
  }

  sink.send_head(head);
  deliver(pipe, std::move(first_chunk), sink, outcome);

  BOOST_LOG_TRIVIAL(info) << "Stream orchestrator: File " << record.id << " sent " << outcome.bytes_sent << "/"
                          << outcome.content_length << " bytes"
                          << (outcome.client_cancelled ? ", client disconnected" : "")
                          << (!outcome.completed && !outcome.client_cancelled ? ", aborted" : "");
  return outcome;
}


//==============================================
// STREAMING
//==============================================

void StreamOrchestrator::produce(remote::ChunkApi& api, const std::vector<core::Part>& parts,
                                 BytePipe& pipe) const {
  try {
    for (const auto& part : parts) {
      PartStreamer streamer(api, part, transfer_unit_);
      core::Bytes chunk;

      while (true) {
        if (pipe.cancelled()) {
          BOOST_LOG_TRIVIAL(debug) << "Stream orchestrator: Reader gone, producer stopping";
          return;
        }
        if (!streamer.next(chunk)) {
          break;
        }
        if (!pipe.write(std::move(chunk))) {
          BOOST_LOG_TRIVIAL(debug) << "Stream orchestrator: Pipe closed by reader, producer stopping";
          return;
        }
        chunk = core::Bytes();
      }
    }
    pipe.close();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Stream orchestrator: Producer failed: " << e.what();
    pipe.close_with_error(std::current_exception());
  }
}

void StreamOrchestrator::deliver(BytePipe& pipe, core::Bytes first_chunk, ResponseSink& sink,
                                 StreamOutcome& outcome) const {
  core::Bytes chunk = std::move(first_chunk);

  try {
    do {
      if (!sink.write_body(chunk.data(), chunk.size())) {
        outcome.client_cancelled = true;
        pipe.cancel();
        BOOST_LOG_TRIVIAL(info) << "Stream orchestrator: Client disconnected after " << outcome.bytes_sent
                                << " bytes";
        return;
      }
      outcome.bytes_sent += chunk.size();
    } while (pipe.read(chunk));
  } catch (const std::exception& e) {
    // Head already committed: the client can only see an early EOF
    BOOST_LOG_TRIVIAL(error) << "Stream orchestrator: Stream failed after " << outcome.bytes_sent
                             << " bytes: " << e.what();
    sink.abort();
    return;
  }

  if (outcome.bytes_sent != outcome.content_length) {
    core::PartialTransferError error("sent " + std::to_string(outcome.bytes_sent) + " of " +
                                     std::to_string(outcome.content_length) + " bytes");
    BOOST_LOG_TRIVIAL(error) << "Stream orchestrator: " << error.what();
    sink.abort();
    return;
  }

  sink.finish();
  outcome.completed = true;
}

} // namespace stream
} // namespace chunkstream
