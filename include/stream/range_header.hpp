#ifndef CHUNKSTREAM_STREAM_RANGE_HEADER_HPP
#define CHUNKSTREAM_STREAM_RANGE_HEADER_HPP

#include <cstdint>
#include <string>
#include "core/types.hpp"

namespace chunkstream {
namespace stream {

/**
 * Parses a single-range "Range" header value against a resource size.
 *
 * Accepted forms: "bytes=a-b", "bytes=a-" and "bytes=-n" (last n bytes,
 * clamped to the size). Multiple ranges are not supported.
 *
 * Throws core::ValidationError for malformed or multi-range values and
 * core::RangeNotSatisfiableError when the range falls outside the resource
 * or its start is after its end.
 */
core::ByteRange parse_range_header(const std::string& header, std::uint64_t total_size);

} // namespace stream
} // namespace chunkstream

#endif // CHUNKSTREAM_STREAM_RANGE_HEADER_HPP
