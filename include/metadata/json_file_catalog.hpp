#ifndef CHUNKSTREAM_METADATA_JSON_FILE_CATALOG_HPP
#define CHUNKSTREAM_METADATA_JSON_FILE_CATALOG_HPP

#include <filesystem>
#include <istream>
#include <unordered_map>
#include "metadata/file_repository.hpp"

namespace chunkstream {
namespace metadata {

// File records loaded once from a JSON catalog:
// {"container_id": N, "files": [{"id", "name", "mime_type", "size", "parts": [..]}]}
class JsonFileCatalog : public FileRepository {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Both throw core::ValidationError on unreadable or inconsistent catalogs
  explicit JsonFileCatalog(const std::filesystem::path& path);
  explicit JsonFileCatalog(std::istream& input);


  // ---- QUERY OPERATIONS ----
  std::optional<core::FileRecord> find(const std::string& id) const override;
  std::size_t size() const { return files_.size(); }

private:
  // ---- PARAMETERS ----
  std::unordered_map<std::string, core::FileRecord> files_;

  void load(std::istream& input, const std::string& source);
};

} // namespace metadata
} // namespace chunkstream

#endif // CHUNKSTREAM_METADATA_JSON_FILE_CATALOG_HPP
