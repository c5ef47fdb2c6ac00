#ifndef CHUNKSTREAM_METADATA_FILE_REPOSITORY_HPP
#define CHUNKSTREAM_METADATA_FILE_REPOSITORY_HPP

#include <optional>
#include <string>
#include "core/types.hpp"

namespace chunkstream {
namespace metadata {

// Read interface of the metadata store: "get file by id"
class FileRepository {
public:
  virtual ~FileRepository() = default;

  // Empty optional when no file has this id; throws core::UpstreamError when
  // the store itself fails
  virtual std::optional<core::FileRecord> find(const std::string& id) const = 0;
};

} // namespace metadata
} // namespace chunkstream

#endif // CHUNKSTREAM_METADATA_FILE_REPOSITORY_HPP
