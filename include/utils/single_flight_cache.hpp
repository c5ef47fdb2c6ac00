#ifndef CHUNKSTREAM_UTILS_SINGLE_FLIGHT_CACHE_HPP
#define CHUNKSTREAM_UTILS_SINGLE_FLIGHT_CACHE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace utils {

/**
 * Keyed memoizer with at most one in-flight computation per key.
 *
 * The first caller for a key runs the loader; concurrent callers wait on the
 * same shared future and observe the same value or exception. Failures are
 * never cached: the entry is dropped before waiters are released, so the next
 * caller goes upstream again. Completed values live for `ttl` (zero keeps
 * them until invalidated).
 */
template <typename Value>
class SingleFlightCache {
public:
  using Loader = std::function<Value()>;
  using Clock = std::chrono::steady_clock;

  explicit SingleFlightCache(std::chrono::milliseconds ttl = std::chrono::milliseconds::zero())
    : ttl_(ttl) {}

  SingleFlightCache(const SingleFlightCache&) = delete;
  SingleFlightCache& operator=(const SingleFlightCache&) = delete;

  /**
   * Returns the cached value for key, computing it with loader when absent
   * or expired. Rethrows the loader's exception to every waiting caller.
   */
  Value get(const std::string& key, const Loader& loader) {
    std::promise<Value> promise;
    std::uint64_t generation = 0;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      auto it = entries_.find(key);
      if (it != entries_.end()) {
        if (!it->second.ready || Clock::now() < it->second.expires_at || ttl_.count() == 0) {
          std::shared_future<Value> future = it->second.future;
          lock.unlock();
          ++hits_;
          BOOST_LOG_TRIVIAL(trace) << "Cache: Hit for key " << key;
          return future.get();
        }
        entries_.erase(it);
      }

      generation = ++generation_;
      Entry entry;
      entry.future = promise.get_future().share();
      entry.generation = generation;
      entries_.emplace(key, std::move(entry));
    }

    ++misses_;
    BOOST_LOG_TRIVIAL(debug) << "Cache: Loading key " << key;

    try {
      Value value = loader();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second.generation == generation) {
          it->second.ready = true;
          it->second.expires_at = Clock::now() + ttl_;
        }
      }
      promise.set_value(value);
      return value;
    } catch (...) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second.generation == generation) {
          entries_.erase(it);
        }
      }
      BOOST_LOG_TRIVIAL(debug) << "Cache: Load failed for key " << key << ", not cached";
      promise.set_exception(std::current_exception());
      throw;
    }
  }

  void invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  std::uint64_t hits() const { return hits_.load(); }
  std::uint64_t misses() const { return misses_.load(); }

private:
  struct Entry {
    std::shared_future<Value> future;
    std::uint64_t generation{0};
    bool ready{false};
    Clock::time_point expires_at{};
  };

  const std::chrono::milliseconds ttl_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::uint64_t generation_{0};
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
};

} // namespace utils
} // namespace chunkstream

#endif // CHUNKSTREAM_UTILS_SINGLE_FLIGHT_CACHE_HPP
