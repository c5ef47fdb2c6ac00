#ifndef CHUNKSTREAM_STREAM_PART_STREAMER_HPP
#define CHUNKSTREAM_STREAM_PART_STREAMER_HPP

#include <cstddef>
#include <cstdint>
#include "core/types.hpp"
#include "remote/chunk_api.hpp"

namespace chunkstream {
namespace stream {

/**
 * Lazy, finite, non-restartable sequence of chunks that reconstructs bytes
 * [local_start, local_end] of one part.
 *
 * Fetches transfer_unit-sized blocks aligned at multiples of transfer_unit,
 * one per next() call, trimming the head of the first block and the tail of
 * the last. At most one block is held at a time.
 */
class PartStreamer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws core::ValidationError for a zero transfer unit or a local window
  // outside the part
  PartStreamer(remote::ChunkApi& api, const core::Part& part, std::size_t transfer_unit);

  PartStreamer(const PartStreamer&) = delete;
  PartStreamer& operator=(const PartStreamer&) = delete;


  // ---- ITERATION ----
  // Fetches the next block into chunk. Returns false once the window is
  // exhausted, or when the backend reports end-of-data on the last block.
  // Throws core::PartialTransferError when a block comes back short before
  // the end of the window, core::UpstreamError when the fetch fails.
  bool next(core::Bytes& chunk);


  // ---- GETTERS ----
  std::size_t expected_fetches() const { return expected_fetches_; }
  std::size_t fetches() const { return fetches_; }
  bool done() const { return done_; }

private:
  // ---- PARAMETERS ----
  remote::ChunkApi& api_;
  core::Part part_;
  std::size_t transfer_unit_;

  std::uint64_t offset_;
  std::size_t first_cut_;
  std::size_t last_cut_;
  std::size_t expected_fetches_;
  std::size_t current_block_{1};
  std::size_t fetches_{0};
  bool done_{false};

  // Fetches one block and unwraps the backend's result variant
  core::Bytes fetch_block();
};

} // namespace stream
} // namespace chunkstream

#endif // CHUNKSTREAM_STREAM_PART_STREAMER_HPP
