#include "metadata/metadata_cache.hpp"
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace metadata {

MetadataCache::MetadataCache(std::chrono::milliseconds ttl)
  : files_(ttl)
  , containers_(ttl)
  , parts_(ttl) {
  BOOST_LOG_TRIVIAL(info) << "Metadata cache: Initialized with ttl " << ttl.count() << "ms";
}

core::FileRecord MetadataCache::file(const std::string& file_id,
                                     const std::function<core::FileRecord()>& loader) {
  return files_.get("files:" + file_id, loader);
}

remote::ContainerHandle MetadataCache::container(std::int64_t container_id,
                                                 const std::function<remote::ContainerHandle()>& loader) {
  return containers_.get("containers:" + std::to_string(container_id), loader);
}

std::vector<core::Part> MetadataCache::parts(const std::string& file_id,
                                             const std::function<std::vector<core::Part>()>& loader) {
  return parts_.get("parts:" + file_id, loader);
}

void MetadataCache::clear() {
  files_.clear();
  containers_.clear();
  parts_.clear();
  BOOST_LOG_TRIVIAL(debug) << "Metadata cache: Cleared";
}

std::uint64_t MetadataCache::hits() const {
  return files_.hits() + containers_.hits() + parts_.hits();
}

std::uint64_t MetadataCache::misses() const {
  return files_.misses() + containers_.misses() + parts_.misses();
}

} // namespace metadata
} // namespace chunkstream
