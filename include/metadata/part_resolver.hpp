#ifndef CHUNKSTREAM_METADATA_PART_RESOLVER_HPP
#define CHUNKSTREAM_METADATA_PART_RESOLVER_HPP

#include <string>
#include <vector>
#include "core/types.hpp"
#include "metadata/file_repository.hpp"
#include "metadata/metadata_cache.hpp"
#include "remote/chunk_api.hpp"

namespace chunkstream {
namespace metadata {

class PartResolver {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PartResolver(const FileRepository& repository, MetadataCache& cache);


  // ---- RESOLUTION ----
  // Cached file record; throws core::NotFoundError for unknown ids
  core::FileRecord resolve_file(const std::string& file_id);
  // Cached ordered parts of a file; throws core::UpstreamError when the
  // backend fails or returns parts that do not describe the record
  std::vector<core::Part> resolve_parts(remote::ChunkApi& api, const core::FileRecord& record);
  // Record plus parts
  core::FileDescriptor resolve_descriptor(remote::ChunkApi& api, const core::FileRecord& record);


  // ---- DECODING ----
  // Decodes backend messages into parts ordered by record.part_ids and
  // verifies uniform part size and total size
  static std::vector<core::Part> decode_parts(const core::FileRecord& record,
                                              const std::vector<remote::MessageVariant>& messages);

private:
  // ---- PARAMETERS ----
  const FileRepository& repository_;
  MetadataCache& cache_;
};

} // namespace metadata
} // namespace chunkstream

#endif // CHUNKSTREAM_METADATA_PART_RESOLVER_HPP
