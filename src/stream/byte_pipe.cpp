#include "stream/byte_pipe.hpp"
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace stream {

BytePipe::BytePipe(std::size_t capacity_bytes)
  : capacity_(capacity_bytes == 0 ? 1 : capacity_bytes) {}


//==============================================
// WRITER SIDE
//==============================================

bool BytePipe::write(core::Bytes chunk) {
  std::unique_lock<std::mutex> lock(mutex_);

  not_full_.wait(lock, [this, &chunk]() {
    return cancelled_ || closed_ || buffered_ == 0 || buffered_ + chunk.size() <= capacity_;
  });

  if (cancelled_ || closed_) {
    BOOST_LOG_TRIVIAL(debug) << "Byte pipe: Write rejected, pipe "
                             << (cancelled_ ? "cancelled by reader" : "already closed");
    return false;
  }

  buffered_ += chunk.size();
  queue_.push_back(std::move(chunk));
  BOOST_LOG_TRIVIAL(trace) << "Byte pipe: Buffered " << buffered_ << "/" << capacity_ << " bytes";
  lock.unlock();

  not_empty_.notify_one();
  return true;
}

void BytePipe::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

void BytePipe::close_with_error(std::exception_ptr error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
      error_ = std::move(error);
      closed_ = true;
    }
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}


//==============================================
// READER SIDE
//==============================================

bool BytePipe::read(core::Bytes& chunk) {
  std::unique_lock<std::mutex> lock(mutex_);

  not_empty_.wait(lock, [this]() {
    return !queue_.empty() || closed_ || cancelled_;
  });

  if (!queue_.empty()) {
    chunk = std::move(queue_.front());
    queue_.pop_front();
    buffered_ -= chunk.size();
    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  chunk.clear();
  if (error_) {
    std::rethrow_exception(error_);
  }
  return false;
}

void BytePipe::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    queue_.clear();
    buffered_ = 0;
  }
  BOOST_LOG_TRIVIAL(debug) << "Byte pipe: Cancelled by reader";
  not_full_.notify_all();
  not_empty_.notify_all();
}


//==============================================
// QUERY METHODS
//==============================================

bool BytePipe::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

std::size_t BytePipe::buffered_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffered_;
}

} // namespace stream
} // namespace chunkstream
