#ifndef CHUNKSTREAM_STREAM_BYTE_PIPE_HPP
#define CHUNKSTREAM_STREAM_BYTE_PIPE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include "core/types.hpp"

namespace chunkstream {
namespace stream {

// Bounded single-producer/single-consumer queue of byte chunks.
// The writer blocks while the buffered bytes would exceed capacity; the
// reader blocks while it is empty. A chunk larger than the capacity is
// admitted when the pipe is empty.
class BytePipe {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BytePipe(std::size_t capacity_bytes);
  ~BytePipe() = default;

  BytePipe(const BytePipe&) = delete;
  BytePipe& operator=(const BytePipe&) = delete;


  // ---- WRITER SIDE ----
  // Blocks for room; false when the reader cancelled or the pipe is closed
  bool write(core::Bytes chunk);
  // End of data
  void close();
  // End of data with a failure the reader rethrows after draining
  void close_with_error(std::exception_ptr error);


  // ---- READER SIDE ----
  // Blocks for the next chunk; false at end of data. Rethrows the writer's
  // error once buffered chunks are drained.
  bool read(core::Bytes& chunk);
  // Reader is gone; wakes and fails any blocked writer
  void cancel();


  // ---- QUERY METHODS ----
  bool cancelled() const;
  std::size_t buffered_bytes() const;
  std::size_t capacity() const { return capacity_; }

private:
  // ---- PARAMETERS ----
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<core::Bytes> queue_;
  std::size_t buffered_{0};
  bool closed_{false};
  bool cancelled_{false};
  std::exception_ptr error_;
};

} // namespace stream
} // namespace chunkstream

#endif // CHUNKSTREAM_STREAM_BYTE_PIPE_HPP
