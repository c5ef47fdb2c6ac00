#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "core/errors.hpp"
#include "metadata/json_file_catalog.hpp"
#include "test_utils.hpp"

using namespace chunkstream;
using namespace chunkstream::metadata;

class JsonFileCatalogTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
  }

  static JsonFileCatalog load(const std::string& json) {
    std::istringstream input(json);
    return JsonFileCatalog(input);
  }
};

TEST_F(JsonFileCatalogTest, LoadsRecords) {
  auto catalog = load(R"({
    "container_id": 1001,
    "files": [
      {"id": "a1", "name": "clip.mp4", "mime_type": "video/mp4", "size": 2500, "parts": [11, 12, 13]},
      {"id": "b2", "name": "notes.txt", "size": 0},
      {"id": "c3", "name": "other.bin", "size": 5, "parts": [4], "container_id": 2002}
    ]
  })");

  EXPECT_EQ(catalog.size(), 3);

  auto clip = catalog.find("a1");
  ASSERT_TRUE(clip.has_value());
  EXPECT_EQ(clip->name, "clip.mp4");
  EXPECT_EQ(clip->mime_type, "video/mp4");
  EXPECT_EQ(clip->size, 2500);
  EXPECT_EQ(clip->container_id, 1001);
  EXPECT_EQ(clip->part_ids, (std::vector<std::int32_t>{11, 12, 13}));

  auto notes = catalog.find("b2");
  ASSERT_TRUE(notes.has_value());
  EXPECT_EQ(notes->mime_type, "application/octet-stream");
  EXPECT_TRUE(notes->part_ids.empty());

  EXPECT_EQ(catalog.find("c3")->container_id, 2002);
  EXPECT_FALSE(catalog.find("zz").has_value());
}

TEST_F(JsonFileCatalogTest, SkipsFolders) {
  auto catalog = load(R"({
    "container_id": 1,
    "files": [
      {"id": "dir", "name": "Videos", "type": "folder", "size": 0},
      {"id": "f", "name": "x", "type": "file", "size": 1, "parts": [1]}
    ]
  })");

  EXPECT_EQ(catalog.size(), 1);
  EXPECT_FALSE(catalog.find("dir").has_value());
}

TEST_F(JsonFileCatalogTest, RejectsInconsistentCatalogs) {
  // Not JSON
  EXPECT_THROW(load("{ nope"), core::ValidationError);
  // No files array
  EXPECT_THROW(load(R"({"container_id": 1})"), core::ValidationError);
  // Bytes without parts
  EXPECT_THROW(load(R"({"container_id": 1, "files": [{"id": "a", "name": "a", "size": 3}]})"),
               core::ValidationError);
  // Parts without a container
  EXPECT_THROW(load(R"({"files": [{"id": "a", "name": "a", "size": 3, "parts": [1]}]})"),
               core::ValidationError);
  // Duplicate ids
  EXPECT_THROW(load(R"({"container_id": 1, "files": [
                 {"id": "a", "name": "a", "size": 0},
                 {"id": "a", "name": "b", "size": 0}]})"),
               core::ValidationError);
  // Size is not a number
  EXPECT_THROW(load(R"({"container_id": 1, "files": [{"id": "a", "name": "a", "size": "big"}]})"),
               core::ValidationError);
}

TEST_F(JsonFileCatalogTest, LoadsFromFile) {
  const auto path = std::filesystem::temp_directory_path() /
    ("catalog_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + ".json");
  {
    std::ofstream out(path);
    out << R"({"container_id": 3, "files": [{"id": "f", "name": "f", "size": 4, "parts": [9]}]})";
  }

  JsonFileCatalog catalog(path);
  EXPECT_EQ(catalog.size(), 1);
  EXPECT_EQ(catalog.find("f")->part_ids.front(), 9);

  std::filesystem::remove(path);
  EXPECT_THROW(JsonFileCatalog{path}, core::ValidationError);
}
