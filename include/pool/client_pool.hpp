#ifndef CHUNKSTREAM_POOL_CLIENT_POOL_HPP
#define CHUNKSTREAM_POOL_CLIENT_POOL_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "remote/chunk_api.hpp"

namespace chunkstream {
namespace pool {

enum class PoolMode {
  Dedicated,  // one client per caller identity
  Shared      // fixed pool, least-loaded selection
};

// A remote client session and the number of streams currently using it
struct RemoteClient {
  std::shared_ptr<remote::ChunkApi> api;
  std::string identity;
  int workload{0};
};

class ClientPool;

// Move-only handle on a selected client; releases its workload on destruction
class WorkloadLease {
public:
  WorkloadLease(WorkloadLease&& other) noexcept;
  WorkloadLease& operator=(WorkloadLease&& other) noexcept;
  ~WorkloadLease();

  WorkloadLease(const WorkloadLease&) = delete;
  WorkloadLease& operator=(const WorkloadLease&) = delete;

  remote::ChunkApi& api() const { return *api_; }
  const std::string& identity() const { return identity_; }
  // Loggable name: the shared client's name or a fingerprint of the caller
  const std::string& label() const { return label_; }

  // Releases early; later calls and the destructor do nothing
  void release();

private:
  friend class ClientPool;
  WorkloadLease(ClientPool* pool, std::size_t index, std::shared_ptr<remote::ChunkApi> api, std::string identity,
                std::string label);

  ClientPool* pool_;
  std::size_t index_;
  std::shared_ptr<remote::ChunkApi> api_;
  std::string identity_;
  std::string label_;
};

class ClientPool {
public:
  using ClientFactory = std::function<std::shared_ptr<remote::ChunkApi>(const std::string& identity)>;

  static constexpr std::size_t kDefaultMaxDedicated = 256;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Shared mode creates pool_size clients up front, named "shared-<n>".
  // Dedicated mode keeps at most max_dedicated clients, evicting the least
  // recently used idle one when full.
  ClientPool(PoolMode mode, std::size_t pool_size, ClientFactory factory,
             std::size_t max_dedicated = kDefaultMaxDedicated);
  ~ClientPool();

  ClientPool(const ClientPool&) = delete;
  ClientPool& operator=(const ClientPool&) = delete;


  // ---- SELECTION ----
  // Dedicated: the caller's own client, created on first use; throws
  // core::UnauthorizedError for an empty identity. When every cached client
  // is busy the new one serves this lease only.
  // Shared: the least-loaded client, its workload incremented until the
  // lease is released.
  WorkloadLease acquire(const std::string& caller_identity);


  // ---- QUERY METHODS ----
  PoolMode mode() const { return mode_; }
  std::size_t size() const;
  std::vector<int> workloads() const;

private:
  friend class WorkloadLease;

  // ---- PARAMETERS ----
  const PoolMode mode_;
  ClientFactory factory_;
  mutable std::mutex mutex_;
  std::vector<RemoteClient> shared_;

  struct DedicatedClient {
    std::shared_ptr<remote::ChunkApi> api;
    std::string label;
    std::uint64_t last_used{0};
  };
  const std::size_t max_dedicated_;
  std::map<std::string, DedicatedClient> dedicated_;
  std::uint64_t tick_{0};


  // ---- WORKLOAD ----
  void release(std::size_t index);
  // Drops the least recently used client nobody is streaming through
  bool evict_idle_dedicated();
};

} // namespace pool
} // namespace chunkstream

#endif // CHUNKSTREAM_POOL_CLIENT_POOL_HPP
