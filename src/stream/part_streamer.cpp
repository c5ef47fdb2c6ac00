#include "stream/part_streamer.hpp"
#include "core/errors.hpp"
#include <variant>
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace stream {

namespace {

struct FetchResultDecoder {
  std::int64_t document_id;

  core::Bytes operator()(remote::FilePayload& payload) const {
    return std::move(payload.bytes);
  }

  core::Bytes operator()(remote::FileCdnRedirect& redirect) const {
    throw core::UpstreamError("unexpected variant: document " + std::to_string(document_id) +
                              " redirected to data center " + std::to_string(redirect.dc_id));
  }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PartStreamer::PartStreamer(remote::ChunkApi& api, const core::Part& part, std::size_t transfer_unit)
  : api_(api)
  , part_(part)
  , transfer_unit_(transfer_unit) {

  if (transfer_unit_ == 0) {
    throw core::ValidationError("transfer unit must be positive");
  }
  if (part_.local_start > part_.local_end || part_.local_end >= part_.size) {
    throw core::ValidationError("part window " + std::to_string(part_.local_start) + "-" +
                                std::to_string(part_.local_end) + " is outside part of size " +
                                std::to_string(part_.size));
  }

  const std::uint64_t unit = transfer_unit_;
  offset_ = part_.local_start - (part_.local_start % unit);
  first_cut_ = static_cast<std::size_t>(part_.local_start - offset_);
  last_cut_ = static_cast<std::size_t>(part_.local_end % unit) + 1;
  expected_fetches_ = static_cast<std::size_t>((part_.local_end + unit) / unit - offset_ / unit);

  BOOST_LOG_TRIVIAL(trace) << "Part streamer: Document " << part_.location.id << " window "
                           << part_.local_start << "-" << part_.local_end << " needs "
                           << expected_fetches_ << " fetches";
}


//==============================================
// ITERATION
//==============================================

bool PartStreamer::next(core::Bytes& chunk) {
  chunk.clear();
  if (done_ || current_block_ > expected_fetches_) {
    done_ = true;
    return false;
  }

  const bool first = current_block_ == 1;
  const bool last = current_block_ == expected_fetches_;

  core::Bytes block = fetch_block();

  // Every expected block, the last one included, owes at least one byte
  if (block.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Part streamer: Document " << part_.location.id
                             << " ended early at offset " << offset_;
    throw core::PartialTransferError("document " + std::to_string(part_.location.id) +
                                     " returned no data at offset " + std::to_string(offset_) +
                                     ", block " + std::to_string(current_block_) + " of " +
                                     std::to_string(expected_fetches_));
  }

  // Bytes this block must supply, counted from its aligned start
  const std::size_t needed = last ? last_cut_ : transfer_unit_;
  if (block.size() < needed) {
    throw core::PartialTransferError("document " + std::to_string(part_.location.id) + " returned " +
                                     std::to_string(block.size()) + " bytes at offset " +
                                     std::to_string(offset_) + ", expected at least " +
                                     std::to_string(needed));
  }

  if (block.size() > needed) {
    block.resize(needed);
  }
  if (first && first_cut_ > 0) {
    block.erase(block.begin(), block.begin() + static_cast<std::ptrdiff_t>(first_cut_));
  }

  chunk = std::move(block);
  offset_ += transfer_unit_;
  ++current_block_;
  if (current_block_ > expected_fetches_) {
    done_ = true;
  }
  return true;
}

core::Bytes PartStreamer::fetch_block() {
  ++fetches_;
  remote::FetchResult result = api_.fetch(part_.location, offset_, static_cast<std::uint32_t>(transfer_unit_));
  return std::visit(FetchResultDecoder{part_.location.id}, result);
}

} // namespace stream
} // namespace chunkstream
