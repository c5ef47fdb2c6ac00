#include "metadata/part_resolver.hpp"
#include "core/errors.hpp"
#include <unordered_map>
#include <utility>
#include <variant>
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace metadata {

namespace {

// Exhaustive visitors over the backend's message variants. A missing
// overload fails to compile; an unexpected alternative is an upstream error.
struct DocumentDecoder {
  std::int32_t message_id;

  core::Part operator()(const remote::Document& document) const {
    core::Part part;
    part.location = document.location;
    part.size = document.size;
    part.local_start = 0;
    part.local_end = document.size == 0 ? 0 : document.size - 1;
    return part;
  }

  core::Part operator()(const remote::DocumentEmpty&) const {
    throw core::UpstreamError("message " + std::to_string(message_id) + " holds an empty document");
  }
};

struct MediaDecoder {
  std::int32_t message_id;

  core::Part operator()(const remote::MediaDocument& media) const {
    return std::visit(DocumentDecoder{message_id}, media.document);
  }

  core::Part operator()(const remote::MediaPhoto&) const {
    throw core::UpstreamError("unexpected variant: message " + std::to_string(message_id) + " holds a photo");
  }

  core::Part operator()(const remote::MediaEmpty&) const {
    throw core::UpstreamError("unexpected variant: message " + std::to_string(message_id) + " has no media");
  }
};

struct MessageDecoder {
  std::pair<std::int32_t, core::Part> operator()(const remote::Message& message) const {
    return {message.id, std::visit(MediaDecoder{message.id}, message.media)};
  }

  std::pair<std::int32_t, core::Part> operator()(const remote::MessageEmpty& message) const {
    throw core::UpstreamError("part message " + std::to_string(message.id) + " no longer exists");
  }

  std::pair<std::int32_t, core::Part> operator()(const remote::MessageService& message) const {
    throw core::UpstreamError("unexpected variant: message " + std::to_string(message.id) +
                              " is a service message");
  }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PartResolver::PartResolver(const FileRepository& repository, MetadataCache& cache)
  : repository_(repository)
  , cache_(cache) {}


//==============================================
// RESOLUTION
//==============================================

core::FileRecord PartResolver::resolve_file(const std::string& file_id) {
  return cache_.file(file_id, [this, &file_id]() {
    auto record = repository_.find(file_id);
    if (!record) {
      BOOST_LOG_TRIVIAL(info) << "Part resolver: Unknown file " << file_id;
      throw core::NotFoundError("file " + file_id);
    }
    return *record;
  });
}

std::vector<core::Part> PartResolver::resolve_parts(remote::ChunkApi& api, const core::FileRecord& record) {
  if (record.part_ids.empty()) {
    return {};
  }

  return cache_.parts(record.id, [this, &api, &record]() {
    BOOST_LOG_TRIVIAL(debug) << "Part resolver: Resolving " << record.part_ids.size()
                             << " parts of file " << record.id;

    remote::ContainerHandle container = cache_.container(record.container_id, [&api, &record]() {
      return api.resolve_container(record.container_id);
    });

    return decode_parts(record, api.get_messages(container, record.part_ids));
  });
}

core::FileDescriptor PartResolver::resolve_descriptor(remote::ChunkApi& api, const core::FileRecord& record) {
  core::FileDescriptor descriptor;
  descriptor.id = record.id;
  descriptor.name = record.name;
  descriptor.mime_type = record.mime_type;
  descriptor.total_size = record.size;
  descriptor.parts = resolve_parts(api, record);
  return descriptor;
}


//==============================================
// DECODING
//==============================================

std::vector<core::Part> PartResolver::decode_parts(const core::FileRecord& record,
                                                   const std::vector<remote::MessageVariant>& messages) {
  std::unordered_map<std::int32_t, core::Part> by_id;
  for (const auto& message : messages) {
    by_id.insert(std::visit(MessageDecoder{}, message));
  }

  std::vector<core::Part> parts;
  parts.reserve(record.part_ids.size());
  for (std::int32_t id : record.part_ids) {
    auto it = by_id.find(id);
    if (it == by_id.end()) {
      throw core::UpstreamError("part message " + std::to_string(id) + " of file " + record.id +
                                " was not returned");
    }
    parts.push_back(it->second);
  }

  // Parts are cut at a fixed size; only the last may be shorter
  std::uint64_t total = 0;
  const std::uint64_t chunk_size = parts.empty() ? 0 : parts.front().size;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const bool last = i + 1 == parts.size();
    if (parts[i].size == 0 || parts[i].size > chunk_size || (!last && parts[i].size != chunk_size)) {
      throw core::UpstreamError("part " + std::to_string(i) + " of file " + record.id + " has size " +
                                std::to_string(parts[i].size) + ", expected " + std::to_string(chunk_size));
    }
    total += parts[i].size;
  }

  if (total != record.size) {
    throw core::UpstreamError("parts of file " + record.id + " hold " + std::to_string(total) +
                              " bytes, record says " + std::to_string(record.size));
  }

  BOOST_LOG_TRIVIAL(debug) << "Part resolver: Decoded " << parts.size() << " parts of file " << record.id;
  return parts;
}

} // namespace metadata
} // namespace chunkstream
