#include "pool/client_pool.hpp"
#include "core/errors.hpp"
#include "remote/request_signer.hpp"
#include <limits>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace chunkstream {
namespace pool {

namespace {
constexpr std::size_t kNoCounter = std::numeric_limits<std::size_t>::max();
}

//==============================================
// WORKLOAD LEASE
//==============================================

WorkloadLease::WorkloadLease(ClientPool* pool, std::size_t index,
                             std::shared_ptr<remote::ChunkApi> api, std::string identity, std::string label)
  : pool_(pool)
  , index_(index)
  , api_(std::move(api))
  , identity_(std::move(identity))
  , label_(std::move(label)) {}

WorkloadLease::WorkloadLease(WorkloadLease&& other) noexcept
  : pool_(other.pool_)
  , index_(other.index_)
  , api_(std::move(other.api_))
  , identity_(std::move(other.identity_))
  , label_(std::move(other.label_)) {
  other.pool_ = nullptr;
}

WorkloadLease& WorkloadLease::operator=(WorkloadLease&& other) noexcept {
  if (this != &other) {
    release();
    pool_ = other.pool_;
    index_ = other.index_;
    api_ = std::move(other.api_);
    identity_ = std::move(other.identity_);
    label_ = std::move(other.label_);
    other.pool_ = nullptr;
  }
  return *this;
}

WorkloadLease::~WorkloadLease() {
  release();
}

void WorkloadLease::release() {
  if (pool_ && index_ != kNoCounter) {
    pool_->release(index_);
  }
  pool_ = nullptr;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ClientPool::ClientPool(PoolMode mode, std::size_t pool_size, ClientFactory factory, std::size_t max_dedicated)
  : mode_(mode)
  , factory_(std::move(factory))
  , max_dedicated_(max_dedicated) {

  if (!factory_) {
    throw std::invalid_argument("Client pool: client factory is required");
  }

  if (mode_ == PoolMode::Shared) {
    if (pool_size == 0) {
      throw core::ValidationError("shared client pool needs at least one client");
    }
    shared_.reserve(pool_size);
    for (std::size_t i = 0; i < pool_size; ++i) {
      RemoteClient client;
      client.identity = "shared-" + std::to_string(i);
      client.api = factory_(client.identity);
      shared_.push_back(std::move(client));
    }
    BOOST_LOG_TRIVIAL(info) << "Client pool: Started shared pool with " << pool_size << " clients";
  } else {
    if (max_dedicated_ == 0) {
      throw core::ValidationError("dedicated client pool needs room for at least one client");
    }
    BOOST_LOG_TRIVIAL(info) << "Client pool: Started in dedicated mode, up to " << max_dedicated_ << " clients";
  }
}

ClientPool::~ClientPool() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& client : shared_) {
    if (client.workload != 0) {
      BOOST_LOG_TRIVIAL(warning) << "Client pool: Client " << client.identity
                                 << " destroyed with workload " << client.workload;
    }
  }
}


//==============================================
// SELECTION
//==============================================

WorkloadLease ClientPool::acquire(const std::string& caller_identity) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (mode_ == PoolMode::Dedicated) {
    if (caller_identity.empty()) {
      throw core::UnauthorizedError("a caller identity is required");
    }
    auto it = dedicated_.find(caller_identity);
    if (it == dedicated_.end()) {
      DedicatedClient client;
      client.label = remote::RequestSigner::fingerprint(caller_identity);
      client.api = factory_(caller_identity);

      if (dedicated_.size() >= max_dedicated_ && !evict_idle_dedicated()) {
        BOOST_LOG_TRIVIAL(warning) << "Client pool: All " << dedicated_.size()
                                   << " dedicated clients busy, " << client.label << " not cached";
        return WorkloadLease(nullptr, kNoCounter, client.api, caller_identity, client.label);
      }
      BOOST_LOG_TRIVIAL(info) << "Client pool: Creating dedicated client " << client.label;
      it = dedicated_.emplace(caller_identity, std::move(client)).first;
    }
    it->second.last_used = ++tick_;
    return WorkloadLease(nullptr, kNoCounter, it->second.api, caller_identity, it->second.label);
  }

  // Lowest workload wins; ties go to the lowest index
  std::size_t selected = 0;
  for (std::size_t i = 1; i < shared_.size(); ++i) {
    if (shared_[i].workload < shared_[selected].workload) {
      selected = i;
    }
  }

  RemoteClient& client = shared_[selected];
  ++client.workload;
  BOOST_LOG_TRIVIAL(debug) << "Client pool: Selected " << client.identity << ", workload now "
                           << client.workload;
  return WorkloadLease(this, selected, client.api, client.identity, client.identity);
}

void ClientPool::release(std::size_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  RemoteClient& client = shared_.at(index);
  --client.workload;
  BOOST_LOG_TRIVIAL(debug) << "Client pool: Released " << client.identity << ", workload now "
                           << client.workload;
}


//==============================================
// QUERY METHODS
//==============================================

bool ClientPool::evict_idle_dedicated() {
  auto victim = dedicated_.end();
  for (auto it = dedicated_.begin(); it != dedicated_.end(); ++it) {
    // Only the pool holds an idle client
    if (it->second.api.use_count() == 1 &&
        (victim == dedicated_.end() || it->second.last_used < victim->second.last_used)) {
      victim = it;
    }
  }
  if (victim == dedicated_.end()) {
    return false;
  }
  BOOST_LOG_TRIVIAL(debug) << "Client pool: Evicting idle dedicated client " << victim->second.label;
  dedicated_.erase(victim);
  return true;
}

std::size_t ClientPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mode_ == PoolMode::Shared ? shared_.size() : dedicated_.size();
}

std::vector<int> ClientPool::workloads() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<int> result;
  result.reserve(shared_.size());
  for (const auto& client : shared_) {
    result.push_back(client.workload);
  }
  return result;
}

} // namespace pool
} // namespace chunkstream
