// ---- STREAM ----
// BytePipe Documentation
/*
DOCUMENTATION:
CLASS: BytePipe

VARIABLES:
  . const size_t capacity_
      - Upper bound on buffered bytes before write() blocks
  . deque<Bytes> queue_
      - Chunks waiting for the consumer
  . size_t buffered_
      - Sum of the sizes of queued chunks
  . bool closed_, cancelled_
      - End of data from the producer / consumer went away
  . exception_ptr error_
      - Producer failure, rethrown by read()

CONSTRUCTOR:
  . BytePipe(size_t capacity_bytes)
      - A capacity of 0 is treated as 1

METHODS:
  . bool write(Bytes chunk)
      - Blocks while the pipe is full
      - A chunk larger than capacity is accepted once the pipe is empty
      - Returns false once the consumer cancelled

  . bool read(Bytes& chunk)
      - Blocks until a chunk, close or error
      - Returns false at clean end of data
      - Rethrows the producer error after the queue drains

  . void close() / close_with_error(exception_ptr) / cancel()
      - Wake both sides
*/

// PartStreamer Documentation
/*
DOCUMENTATION:
CLASS: PartStreamer

VARIABLES:
  . Part part_
      - Part with request-scoped local_start / local_end
  . size_t transfer_unit_
      - Aligned block size U
  . uint64_t offset_
      - Next aligned fetch offset, starts at floor(local_start / U) * U
  . size_t expected_fetches_
      - ceil((local_end + 1) / U) - floor(local_start / U)

METHODS:
  . bool next(Bytes& chunk)
      - Fetches one block and trims it to the requested window
      - Returns false once every expected block was delivered
      - Throws PartialTransferError on an empty or short block
      - Throws UpstreamError on a CDN redirect or a failed fetch
*/

// StreamOrchestrator Documentation
/*
DOCUMENTATION:
CLASS: StreamOrchestrator

CONSTRUCTOR:
  . StreamOrchestrator(PartResolver&, ClientPool&, size_t transfer_unit)

METHODS:
  . StreamOutcome serve(const StreamRequest& request, ResponseSink& sink)
      - Leases a client, resolves the record and range, builds the head
      - HEAD and empty windows finish without touching the backend
      - Starts a producer thread feeding a BytePipe of one transfer unit
      - Reads the first chunk before sending the head, so early failures
        still surface as exceptions the caller can map to a status
      - After the head is committed failures abort the sink
      - Returns counters describing how the stream ended

  . static ResponseHead build_head(const FileRecord&, optional<ByteRange>, bool partial)
      - 200 or 206, Accept-Ranges, Content-Range, Content-Type,
        Content-Length, Content-Disposition
*/


// ---- METADATA ----
// PartResolver Documentation
/*
DOCUMENTATION:
CLASS: PartResolver

METHODS:
  . FileRecord resolve_file(const string& file_id)
      - Throws NotFoundError for unknown ids

  . vector<Part> resolve_parts(ChunkApi& api, const FileRecord& record)
      - Cached by file id; concurrent callers share one backend lookup
      - Failures are not cached

  . static vector<Part> decode_parts(const FileRecord&, const vector<MessageVariant>&)
      - Keeps record order, rejects non-document messages and size mismatches
*/


// ---- POOL ----
// ClientPool Documentation
/*
DOCUMENTATION:
CLASS: ClientPool

VARIABLES:
  . PoolMode mode_
      - Shared: fixed set of clients, least-loaded wins
      - Dedicated: one client per caller identity, created on first use,
        at most max_dedicated_ cached; the least recently used idle one is
        evicted when full

METHODS:
  . WorkloadLease acquire(const string& caller_identity)
      - Shared mode increments the chosen client's workload
      - Dedicated mode throws UnauthorizedError for an empty identity

CLASS: WorkloadLease
  . Move-only; releases the workload on destruction or release()
  . label() is what gets logged: "shared-<n>" or a fingerprint of the caller
*/


// ---- NETWORK ----
// HttpServer Documentation
/*
DOCUMENTATION:
CLASS: HttpServer

VARIABLES:
  . io_context_, acceptor_, io_thread_
      - Accept loop on its own thread
  . set<shared_ptr<socket>> sessions_
      - Open connections, each served by a detached session thread

METHODS:
  . bool start_listener()
      - Binds, records the bound port, starts accepting
      - Returns false when the address cannot be bound

  . void shutdown()
      - Stops accepting, shuts down open sockets, waits for sessions

ERROR MAPPING (before the head is sent):
  . RangeNotSatisfiableError -> 416 with Content-Range: bytes * / size
  . ValidationError          -> 400
  . UnauthorizedError        -> 401
  . NotFoundError            -> 404
  . UpstreamError            -> 502
  . anything else            -> 500
*/


// ---- LOGGER ----
// Logger Documentation
/*
DOCUMENTATION:
FUNCTIONS:
  . void init_logging(const string& log_file, severity_level level)
      - Console sink, plus a file sink when log_file is not empty
      - Format: [timestamp] [thread] [severity] message

  . severity_level parse_severity(const string& name)
      - Throws ValidationError for unknown names

Components log through BOOST_LOG_TRIVIAL with a "Component: " prefix.
*/
