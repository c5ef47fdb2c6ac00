#include "stream/range_header.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <limits>
#include <optional>

namespace chunkstream {
namespace stream {

namespace {

std::string trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

// Empty optional for an empty bound
std::optional<std::uint64_t> parse_bound(const std::string& text, const std::string& header) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      throw core::ValidationError("malformed range header: " + header);
    }
    const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
    if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
      throw core::ValidationError("range bound overflows: " + header);
    }
    value = value * 10 + digit;
  }
  return value;
}

} // namespace

core::ByteRange parse_range_header(const std::string& header, std::uint64_t total_size) {
  const std::string value = trim(header);

  const auto equals = value.find('=');
  if (equals == std::string::npos || trim(value.substr(0, equals)) != "bytes") {
    throw core::ValidationError("unsupported range unit: " + header);
  }

  const std::string range_set = trim(value.substr(equals + 1));
  if (range_set.find(',') != std::string::npos) {
    throw core::ValidationError("multiple ranges are not supported: " + header);
  }

  const auto dash = range_set.find('-');
  if (dash == std::string::npos) {
    throw core::ValidationError("malformed range header: " + header);
  }

  const auto first = parse_bound(trim(range_set.substr(0, dash)), header);
  const auto last = parse_bound(trim(range_set.substr(dash + 1)), header);

  core::ByteRange range;
  if (!first && !last) {
    throw core::ValidationError("malformed range header: " + header);
  }

  if (!first) {
    // Suffix range: last n bytes
    if (*last == 0 || total_size == 0) {
      throw core::RangeNotSatisfiableError("empty suffix range: " + header, total_size);
    }
    const std::uint64_t length = std::min(*last, total_size);
    range.start = total_size - length;
    range.end = total_size - 1;
    return range;
  }

  range.start = *first;
  range.end = last ? *last : (total_size == 0 ? 0 : total_size - 1);

  if (range.start >= total_size) {
    throw core::RangeNotSatisfiableError("range start " + std::to_string(range.start) +
                                         " is past file size " + std::to_string(total_size), total_size);
  }
  if (range.start > range.end) {
    throw core::RangeNotSatisfiableError("range start " + std::to_string(range.start) +
                                         " is after end " + std::to_string(range.end), total_size);
  }
  if (range.end >= total_size) {
    throw core::RangeNotSatisfiableError("range end " + std::to_string(range.end) +
                                         " is past file size " + std::to_string(total_size), total_size);
  }
  return range;
}

} // namespace stream
} // namespace chunkstream
