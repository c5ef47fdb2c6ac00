#include <gtest/gtest.h>
#include <vector>
#include "core/errors.hpp"
#include "stream/range_slicer.hpp"
#include "test_utils.hpp"

using namespace chunkstream;
using namespace chunkstream::stream;

class RangeSlicerTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
  }

  // Total bytes selected by a slice
  static std::uint64_t selected_bytes(const std::vector<core::Part>& slice) {
    std::uint64_t total = 0;
    for (const auto& part : slice) {
      total += part.local_end - part.local_start + 1;
    }
    return total;
  }
};

TEST_F(RangeSlicerTest, RangeAcrossTwoParts) {
  auto parts = test::make_parts(2500, 1000);
  ASSERT_EQ(parts.size(), 3);

  auto slice = slice_parts(parts, {1500, 2200});

  ASSERT_EQ(slice.size(), 2);
  EXPECT_EQ(slice[0].location.id, parts[1].location.id);
  EXPECT_EQ(slice[0].local_start, 500);
  EXPECT_EQ(slice[0].local_end, 999);
  EXPECT_EQ(slice[1].location.id, parts[2].location.id);
  EXPECT_EQ(slice[1].local_start, 0);
  EXPECT_EQ(slice[1].local_end, 200);
  EXPECT_EQ(selected_bytes(slice), 701);
}

TEST_F(RangeSlicerTest, RangeInsideOnePartTrimsOnlyThatPart) {
  auto parts = test::make_parts(2500, 1000);

  auto slice = slice_parts(parts, {1100, 1199});

  ASSERT_EQ(slice.size(), 1);
  EXPECT_EQ(slice[0].location.id, parts[1].location.id);
  EXPECT_EQ(slice[0].local_start, 100);
  EXPECT_EQ(slice[0].local_end, 199);
}

TEST_F(RangeSlicerTest, FullRangeKeepsInteriorPartsWhole) {
  auto parts = test::make_parts(2500, 1000);

  auto slice = slice_parts(parts, {0, 2499});

  ASSERT_EQ(slice.size(), 3);
  for (std::size_t i = 0; i < slice.size(); ++i) {
    EXPECT_EQ(slice[i].local_start, 0) << "part " << i;
    EXPECT_EQ(slice[i].local_end, slice[i].size - 1) << "part " << i;
  }
}

TEST_F(RangeSlicerTest, RangeEndingOnPartBoundary) {
  auto parts = test::make_parts(3000, 1000);

  auto slice = slice_parts(parts, {999, 1999});

  ASSERT_EQ(slice.size(), 2);
  EXPECT_EQ(slice[0].local_start, 999);
  EXPECT_EQ(slice[0].local_end, 999);
  EXPECT_EQ(slice[1].local_start, 0);
  EXPECT_EQ(slice[1].local_end, 999);
}

TEST_F(RangeSlicerTest, InputIsNotModified) {
  auto parts = test::make_parts(2500, 1000);
  const auto before = parts;

  slice_parts(parts, {1500, 2200});

  for (std::size_t i = 0; i < parts.size(); ++i) {
    EXPECT_EQ(parts[i].local_start, before[i].local_start);
    EXPECT_EQ(parts[i].local_end, before[i].local_end);
  }
}

TEST_F(RangeSlicerTest, SelectedLengthMatchesEveryRange) {
  auto parts = test::make_parts(57, 10);

  for (std::uint64_t start = 0; start < 57; ++start) {
    for (std::uint64_t end = start; end < 57; ++end) {
      auto slice = slice_parts(parts, {start, end});
      ASSERT_EQ(selected_bytes(slice), end - start + 1) << "range " << start << "-" << end;
      ASSERT_EQ(slice.front().location.id, parts[start / 10].location.id);
      ASSERT_EQ(slice.back().location.id, parts[end / 10].location.id);
    }
  }
}

TEST_F(RangeSlicerTest, RejectsInvalidRanges) {
  auto parts = test::make_parts(2500, 1000);

  EXPECT_THROW(slice_parts(parts, {10, 5}), core::ValidationError);
  EXPECT_THROW(slice_parts(parts, {0, 2500}), core::ValidationError);
  EXPECT_THROW(slice_parts(parts, {3000, 4000}), core::ValidationError);
  EXPECT_THROW(slice_parts({}, {0, 0}), core::ValidationError);
}
