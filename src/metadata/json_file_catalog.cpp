#include "metadata/json_file_catalog.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace chunkstream {
namespace metadata {

using json = nlohmann::json;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

JsonFileCatalog::JsonFileCatalog(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "File catalog: Loading catalog from " << path.string();

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    BOOST_LOG_TRIVIAL(error) << "File catalog: Cannot open " << path.string();
    throw core::ValidationError("cannot open catalog: " + path.string());
  }
  load(input, path.string());
}

JsonFileCatalog::JsonFileCatalog(std::istream& input) {
  load(input, "stream");
}


//==============================================
// LOADING
//==============================================

void JsonFileCatalog::load(std::istream& input, const std::string& source) {
  json root;
  try {
    root = json::parse(input);
  } catch (const json::parse_error& e) {
    throw core::ValidationError("invalid catalog JSON in " + source + ": " + e.what());
  }

  try {
    const auto default_container = root.value("container_id", std::int64_t{0});
    std::size_t skipped = 0;

    for (const auto& node : root.at("files")) {
      // Folders have no bytes to stream
      if (node.value("type", std::string("file")) != "file") {
        ++skipped;
        continue;
      }

      core::FileRecord record;
      record.id = node.at("id").get<std::string>();
      record.name = node.at("name").get<std::string>();
      record.mime_type = node.value("mime_type", std::string("application/octet-stream"));
      record.size = node.at("size").get<std::uint64_t>();
      record.container_id = node.value("container_id", default_container);

      if (node.contains("parts")) {
        for (const auto& part : node.at("parts")) {
          record.part_ids.push_back(part.get<std::int32_t>());
        }
      }

      if (record.size > 0 && record.part_ids.empty()) {
        throw core::ValidationError("file " + record.id + " has bytes but no parts");
      }
      if (!record.part_ids.empty() && record.container_id == 0) {
        throw core::ValidationError("file " + record.id + " has parts but no container");
      }
      if (files_.count(record.id) != 0) {
        throw core::ValidationError("duplicate file id " + record.id);
      }

      BOOST_LOG_TRIVIAL(trace) << "File catalog: Loaded " << record.id << " (" << record.size
                               << " bytes, " << record.part_ids.size() << " parts)";
      files_.emplace(record.id, std::move(record));
    }

    BOOST_LOG_TRIVIAL(info) << "File catalog: Loaded " << files_.size() << " files from " << source
                            << (skipped ? ", skipped " + std::to_string(skipped) + " non-file entries" : "");
  } catch (const json::exception& e) {
    throw core::ValidationError("malformed catalog " + source + ": " + e.what());
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::optional<core::FileRecord> JsonFileCatalog::find(const std::string& id) const {
  auto it = files_.find(id);
  if (it == files_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace metadata
} // namespace chunkstream
