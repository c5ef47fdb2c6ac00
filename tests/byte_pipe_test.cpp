#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "core/errors.hpp"
#include "stream/byte_pipe.hpp"
#include "test_utils.hpp"

using namespace chunkstream;
using namespace chunkstream::stream;

class BytePipeTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
  }

  BytePipe pipe{8};
};

TEST_F(BytePipeTest, InitialState) {
  EXPECT_EQ(pipe.capacity(), 8);
  EXPECT_EQ(pipe.buffered_bytes(), 0);
  EXPECT_FALSE(pipe.cancelled());
}

TEST_F(BytePipeTest, ChunksComeOutInOrder) {
  ASSERT_TRUE(pipe.write({1, 2}));
  ASSERT_TRUE(pipe.write({3}));
  EXPECT_EQ(pipe.buffered_bytes(), 3);
  pipe.close();

  core::Bytes chunk;
  ASSERT_TRUE(pipe.read(chunk));
  EXPECT_EQ(chunk, (core::Bytes{1, 2}));
  ASSERT_TRUE(pipe.read(chunk));
  EXPECT_EQ(chunk, (core::Bytes{3}));
  EXPECT_FALSE(pipe.read(chunk));
  EXPECT_TRUE(chunk.empty());
}

TEST_F(BytePipeTest, WriteAfterCloseFails) {
  pipe.close();
  EXPECT_FALSE(pipe.write({1}));
}

TEST_F(BytePipeTest, OversizedChunkAdmittedWhenEmpty) {
  ASSERT_TRUE(pipe.write(core::Bytes(32, 0xAB)));
  EXPECT_EQ(pipe.buffered_bytes(), 32);
}

TEST_F(BytePipeTest, WriterBlocksWhileFull) {
  ASSERT_TRUE(pipe.write(core::Bytes(8, 1)));

  std::atomic<bool> written{false};
  std::thread writer([this, &written]() {
    written = pipe.write(core::Bytes(4, 2));
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(written.load());

  core::Bytes chunk;
  EXPECT_TRUE(pipe.read(chunk));
  writer.join();
  EXPECT_TRUE(written.load());
  EXPECT_EQ(pipe.buffered_bytes(), 4);
}

TEST_F(BytePipeTest, ReaderBlocksUntilData) {
  core::Bytes received;
  std::thread reader([this, &received]() {
    core::Bytes chunk;
    while (pipe.read(chunk)) {
      received.insert(received.end(), chunk.begin(), chunk.end());
    }
  });

  for (std::uint8_t i = 0; i < 100; ++i) {
    EXPECT_TRUE(pipe.write({i}));
  }
  pipe.close();
  reader.join();

  ASSERT_EQ(received.size(), 100);
  for (std::size_t i = 0; i < received.size(); ++i) {
    EXPECT_EQ(received[i], i);
  }
}

TEST_F(BytePipeTest, ErrorRethrownAfterDrain) {
  ASSERT_TRUE(pipe.write({7}));
  pipe.close_with_error(std::make_exception_ptr(core::UpstreamError("boom")));

  core::Bytes chunk;
  ASSERT_TRUE(pipe.read(chunk));
  EXPECT_EQ(chunk, (core::Bytes{7}));
  EXPECT_THROW(pipe.read(chunk), core::UpstreamError);
}

TEST_F(BytePipeTest, CancelReleasesBlockedWriter) {
  ASSERT_TRUE(pipe.write(core::Bytes(8, 1)));

  std::atomic<bool> finished{false};
  bool result = true;
  std::thread writer([this, &finished, &result]() {
    result = pipe.write(core::Bytes(8, 2));
    finished = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(finished.load());

  pipe.cancel();
  writer.join();
  EXPECT_FALSE(result);
  EXPECT_TRUE(pipe.cancelled());
  EXPECT_EQ(pipe.buffered_bytes(), 0);

  core::Bytes chunk;
  EXPECT_FALSE(pipe.read(chunk));
}

TEST_F(BytePipeTest, BufferedBytesNeverExceedCapacity) {
  std::atomic<std::size_t> peak{0};
  std::thread writer([this, &peak]() {
    for (int i = 0; i < 200; ++i) {
      if (!pipe.write(core::Bytes(3, 0))) {
        return;
      }
      std::size_t buffered = pipe.buffered_bytes();
      if (buffered > peak) {
        peak = buffered;
      }
    }
    pipe.close();
  });

  core::Bytes chunk;
  std::size_t total = 0;
  while (pipe.read(chunk)) {
    total += chunk.size();
  }
  writer.join();

  EXPECT_EQ(total, 600);
  EXPECT_LE(peak.load(), pipe.capacity());
}
