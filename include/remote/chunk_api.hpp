#ifndef CHUNKSTREAM_REMOTE_CHUNK_API_HPP
#define CHUNKSTREAM_REMOTE_CHUNK_API_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "core/types.hpp"

namespace chunkstream {
namespace remote {

using core::Bytes;
using core::DocumentLocation;

// ---- CONTAINER RESOLUTION ----
// Access handle of the remote container (channel) holding the part messages
struct ContainerHandle {
  std::int64_t id{0};
  std::int64_t access_hash{0};
};


// ---- MESSAGE RESOLUTION ----
// Remote responses are tagged unions; consumers decode them with exhaustive
// visitors and treat unexpected alternatives as upstream errors.
struct Document {
  DocumentLocation location;
  std::uint64_t size{0};
  std::string mime_type;
};

struct DocumentEmpty {
  std::int64_t id{0};
};

using DocumentVariant = std::variant<Document, DocumentEmpty>;

struct MediaDocument {
  DocumentVariant document;
};

struct MediaPhoto {
  std::int64_t photo_id{0};
};

struct MediaEmpty {};

using MediaVariant = std::variant<MediaEmpty, MediaDocument, MediaPhoto>;

struct Message {
  std::int32_t id{0};
  MediaVariant media;
};

struct MessageEmpty {
  std::int32_t id{0};
};

struct MessageService {
  std::int32_t id{0};
  std::string action;
};

using MessageVariant = std::variant<Message, MessageEmpty, MessageService>;


// ---- CHUNK FETCH ----
struct FilePayload {
  Bytes bytes;
};

// Backend asks the caller to fetch from another data center
struct FileCdnRedirect {
  std::int32_t dc_id{0};
};

using FetchResult = std::variant<FilePayload, FileCdnRedirect>;


// Read-only view of the external blob backend for one client session.
// Implementations throw core::UpstreamError on failure.
class ChunkApi {
public:
  virtual ~ChunkApi() = default;

  // Session identity, used in logs
  virtual std::string identity() const = 0;

  // Raw bytes at [offset, offset + limit) of a document. A result shorter
  // than limit (possibly empty) means the document ends inside the window.
  virtual FetchResult fetch(const DocumentLocation& location, std::uint64_t offset, std::uint32_t limit) = 0;

  virtual ContainerHandle resolve_container(std::int64_t container_id) = 0;

  virtual std::vector<MessageVariant> get_messages(const ContainerHandle& container,
                                                   const std::vector<std::int32_t>& ids) = 0;
};

} // namespace remote
} // namespace chunkstream

#endif // CHUNKSTREAM_REMOTE_CHUNK_API_HPP
