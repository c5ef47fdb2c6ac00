#include "stream/range_slicer.hpp"
#include "core/errors.hpp"
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace stream {

std::vector<core::Part> slice_parts(const std::vector<core::Part>& parts, const core::ByteRange& range) {
  if (parts.empty()) {
    throw core::ValidationError("cannot slice a file without parts");
  }
  if (range.start > range.end) {
    throw core::ValidationError("range start " + std::to_string(range.start) + " is after end " +
                                std::to_string(range.end));
  }

  std::uint64_t total_size = 0;
  for (const auto& part : parts) {
    total_size += part.size;
  }
  if (range.end >= total_size) {
    throw core::ValidationError("range end " + std::to_string(range.end) + " is past file size " +
                                std::to_string(total_size));
  }

  const std::uint64_t chunk_size = parts.front().size;

  // Inclusive first index, exclusive last index
  const std::size_t start_index = static_cast<std::size_t>(range.start / chunk_size);
  const std::size_t end_index = static_cast<std::size_t>((range.end + chunk_size) / chunk_size);

  std::vector<core::Part> slice(parts.begin() + start_index, parts.begin() + end_index);
  for (auto& part : slice) {
    part.local_start = 0;
    part.local_end = part.size - 1;
  }
  slice.front().local_start = range.start % chunk_size;
  slice.back().local_end = range.end % chunk_size;

  BOOST_LOG_TRIVIAL(debug) << "Range slicer: Range " << range.start << "-" << range.end
                           << " maps to parts [" << start_index << ", " << end_index << ")";
  return slice;
}

} // namespace stream
} // namespace chunkstream
