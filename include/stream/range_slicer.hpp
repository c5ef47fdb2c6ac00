#ifndef CHUNKSTREAM_STREAM_RANGE_SLICER_HPP
#define CHUNKSTREAM_STREAM_RANGE_SLICER_HPP

#include <vector>
#include "core/types.hpp"

namespace chunkstream {
namespace stream {

// Maps a global inclusive byte range onto the contiguous subset of parts that
// covers it. Returns copies whose local_start/local_end select the needed
// bytes of each part; the input is left untouched.
// Throws core::ValidationError if parts is empty, range.start > range.end or
// range.end is past the last byte.
std::vector<core::Part> slice_parts(const std::vector<core::Part>& parts, const core::ByteRange& range);

} // namespace stream
} // namespace chunkstream

#endif // CHUNKSTREAM_STREAM_RANGE_SLICER_HPP
