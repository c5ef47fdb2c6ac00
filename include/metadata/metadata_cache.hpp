#ifndef CHUNKSTREAM_METADATA_METADATA_CACHE_HPP
#define CHUNKSTREAM_METADATA_METADATA_CACHE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "remote/chunk_api.hpp"
#include "utils/single_flight_cache.hpp"

namespace chunkstream {
namespace metadata {

// Typed single-flight caches for the read-only lookups of a stream request.
// Keys follow "<operation>:<parameter>".
class MetadataCache {
public:
  explicit MetadataCache(std::chrono::milliseconds ttl);

  MetadataCache(const MetadataCache&) = delete;
  MetadataCache& operator=(const MetadataCache&) = delete;

  core::FileRecord file(const std::string& file_id,
                        const std::function<core::FileRecord()>& loader);

  remote::ContainerHandle container(std::int64_t container_id,
                                    const std::function<remote::ContainerHandle()>& loader);

  std::vector<core::Part> parts(const std::string& file_id,
                                const std::function<std::vector<core::Part>()>& loader);

  void clear();

  std::uint64_t hits() const;
  std::uint64_t misses() const;

private:
  utils::SingleFlightCache<core::FileRecord> files_;
  utils::SingleFlightCache<remote::ContainerHandle> containers_;
  utils::SingleFlightCache<std::vector<core::Part>> parts_;
};

} // namespace metadata
} // namespace chunkstream

#endif // CHUNKSTREAM_METADATA_METADATA_CACHE_HPP
