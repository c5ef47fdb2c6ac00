#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "pool/client_pool.hpp"
#include "test_utils.hpp"

using namespace chunkstream;
using namespace chunkstream::pool;

class ClientPoolTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
  }

  ClientPool::ClientFactory factory() {
    return [this](const std::string& identity) {
      created.push_back(identity);
      return std::make_shared<test::FakeChunkApi>(identity);
    };
  }

  std::vector<std::string> created;
};

TEST_F(ClientPoolTest, SharedPoolCreatesClientsUpFront) {
  ClientPool pool(PoolMode::Shared, 3, factory());

  EXPECT_EQ(pool.size(), 3);
  EXPECT_EQ(created, (std::vector<std::string>{"shared-0", "shared-1", "shared-2"}));
  EXPECT_EQ(pool.workloads(), (std::vector<int>{0, 0, 0}));
}

TEST_F(ClientPoolTest, SelectsLeastLoadedLowestIndexFirst) {
  ClientPool pool(PoolMode::Shared, 3, factory());

  auto first = pool.acquire("");
  auto second = pool.acquire("");
  auto third = pool.acquire("");
  EXPECT_EQ(first.identity(), "shared-0");
  EXPECT_EQ(second.identity(), "shared-1");
  EXPECT_EQ(third.identity(), "shared-2");
  EXPECT_EQ(pool.workloads(), (std::vector<int>{1, 1, 1}));

  second.release();
  EXPECT_EQ(pool.workloads(), (std::vector<int>{1, 0, 1}));

  auto fourth = pool.acquire("");
  EXPECT_EQ(fourth.identity(), "shared-1");
  EXPECT_EQ(&fourth.api(), &second.api());
}

TEST_F(ClientPoolTest, LeaseReleasesOnScopeExit) {
  ClientPool pool(PoolMode::Shared, 2, factory());
  {
    auto lease = pool.acquire("");
    EXPECT_EQ(pool.workloads(), (std::vector<int>{1, 0}));
  }
  EXPECT_EQ(pool.workloads(), (std::vector<int>{0, 0}));
}

TEST_F(ClientPoolTest, LeaseReleasesWhenStreamThrows) {
  ClientPool pool(PoolMode::Shared, 2, factory());

  try {
    auto lease = pool.acquire("");
    throw core::UpstreamError("fetch failed");
  } catch (const core::UpstreamError&) {
  }
  EXPECT_EQ(pool.workloads(), (std::vector<int>{0, 0}));
}

TEST_F(ClientPoolTest, MovedLeaseReleasesOnce) {
  ClientPool pool(PoolMode::Shared, 1, factory());

  auto lease = pool.acquire("");
  WorkloadLease moved = std::move(lease);
  lease.release();
  EXPECT_EQ(pool.workloads(), (std::vector<int>{1}));

  moved.release();
  moved.release();
  EXPECT_EQ(pool.workloads(), (std::vector<int>{0}));
}

TEST_F(ClientPoolTest, DedicatedModeReusesClientPerIdentity) {
  ClientPool pool(PoolMode::Dedicated, 0, factory());

  auto alice = pool.acquire("token-a");
  auto again = pool.acquire("token-a");
  auto bob = pool.acquire("token-b");

  EXPECT_EQ(&alice.api(), &again.api());
  EXPECT_NE(&alice.api(), &bob.api());
  EXPECT_EQ(created, (std::vector<std::string>{"token-a", "token-b"}));
  EXPECT_EQ(pool.size(), 2);
  EXPECT_TRUE(pool.workloads().empty());
}

TEST_F(ClientPoolTest, DedicatedModeRequiresIdentity) {
  ClientPool pool(PoolMode::Dedicated, 0, factory());
  EXPECT_THROW(pool.acquire(""), core::UnauthorizedError);
}

TEST_F(ClientPoolTest, DedicatedLabelsHideTheIdentity) {
  ClientPool pool(PoolMode::Dedicated, 0, factory());

  auto lease = pool.acquire("secret-session-token");
  EXPECT_EQ(lease.identity(), "secret-session-token");
  EXPECT_EQ(lease.label().rfind("id-", 0), 0u);
  EXPECT_EQ(lease.label().find("secret"), std::string::npos);
  EXPECT_EQ(lease.label(), pool.acquire("secret-session-token").label());
  EXPECT_NE(lease.label(), pool.acquire("other-token").label());

  ClientPool shared(PoolMode::Shared, 1, factory());
  EXPECT_EQ(shared.acquire("secret-session-token").label(), "shared-0");
}

TEST_F(ClientPoolTest, DedicatedModeEvictsLeastRecentlyUsedIdleClient) {
  ClientPool pool(PoolMode::Dedicated, 0, factory(), 2);

  pool.acquire("a");
  pool.acquire("b");
  pool.acquire("a");
  // "b" is the least recently used idle client
  pool.acquire("c");
  EXPECT_EQ(pool.size(), 2);

  pool.acquire("a");
  EXPECT_EQ(created, (std::vector<std::string>{"a", "b", "c"}));
  pool.acquire("b");
  EXPECT_EQ(created, (std::vector<std::string>{"a", "b", "c", "b"}));
  EXPECT_EQ(pool.size(), 2);
}

TEST_F(ClientPoolTest, DedicatedModeNeverEvictsBusyClients) {
  ClientPool pool(PoolMode::Dedicated, 0, factory(), 1);

  auto busy = pool.acquire("a");
  auto overflow = pool.acquire("b");
  EXPECT_NE(&busy.api(), &overflow.api());
  EXPECT_EQ(pool.size(), 1);

  // "a" is still cached, "b" was served without being kept
  auto again = pool.acquire("a");
  EXPECT_EQ(&busy.api(), &again.api());
  pool.acquire("b");
  EXPECT_EQ(created, (std::vector<std::string>{"a", "b", "b"}));
}

TEST_F(ClientPoolTest, InvalidConstruction) {
  EXPECT_THROW({ ClientPool pool(PoolMode::Shared, 0, factory()); }, core::ValidationError);
  EXPECT_THROW({ ClientPool pool(PoolMode::Shared, 1, nullptr); }, std::invalid_argument);
  EXPECT_THROW({ ClientPool pool(PoolMode::Dedicated, 0, factory(), 0); }, core::ValidationError);
}
