#ifndef CHUNKSTREAM_CORE_TYPES_HPP
#define CHUNKSTREAM_CORE_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace chunkstream {
namespace core {

using Bytes = std::vector<std::uint8_t>;

// Handle of one remote document holding a part's bytes
struct DocumentLocation {
  std::int64_t id{0};
  std::int64_t access_hash{0};
  std::string file_reference;
};

// One backing remote document holding a contiguous slice of a file.
// local_start/local_end select the bytes needed by the current request.
struct Part {
  DocumentLocation location;
  std::uint64_t size{0};
  std::uint64_t local_start{0};
  std::uint64_t local_end{0};
};

// Row of the metadata store, parts listed by remote message id in byte order
struct FileRecord {
  std::string id;
  std::string name;
  std::string mime_type;
  std::uint64_t size{0};
  std::int64_t container_id{0};
  std::vector<std::int32_t> part_ids;
};

struct FileDescriptor {
  std::string id;
  std::string name;
  std::string mime_type;
  std::uint64_t total_size{0};
  std::vector<Part> parts;
};

// Inclusive byte window
struct ByteRange {
  std::uint64_t start{0};
  std::uint64_t end{0};

  std::uint64_t length() const { return end - start + 1; }
};

inline bool operator==(const ByteRange& lhs, const ByteRange& rhs) {
  return lhs.start == rhs.start && lhs.end == rhs.end;
}

} // namespace core
} // namespace chunkstream

#endif // CHUNKSTREAM_CORE_TYPES_HPP
