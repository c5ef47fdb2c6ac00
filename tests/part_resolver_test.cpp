#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include "core/errors.hpp"
#include "metadata/metadata_cache.hpp"
#include "metadata/part_resolver.hpp"
#include "test_utils.hpp"

using namespace chunkstream;
using namespace chunkstream::metadata;
using ::testing::_;
using ::testing::Return;

class MockFileRepository : public FileRepository {
public:
  MOCK_METHOD(std::optional<core::FileRecord>, find, (const std::string& id), (const, override));
};

class MockChunkApi : public remote::ChunkApi {
public:
  MOCK_METHOD(std::string, identity, (), (const, override));
  MOCK_METHOD(remote::FetchResult, fetch,
              (const core::DocumentLocation& location, std::uint64_t offset, std::uint32_t limit), (override));
  MOCK_METHOD(remote::ContainerHandle, resolve_container, (std::int64_t container_id), (override));
  MOCK_METHOD(std::vector<remote::MessageVariant>, get_messages,
              (const remote::ContainerHandle& container, const std::vector<std::int32_t>& ids), (override));
};

namespace {

remote::MessageVariant document_message(std::int32_t id, std::int64_t document_id, std::uint64_t size) {
  remote::Document document;
  document.location.id = document_id;
  document.location.access_hash = document_id + 1;
  document.location.file_reference = "ref";
  document.size = size;
  return remote::Message{id, remote::MediaDocument{document}};
}

core::FileRecord make_record(std::uint64_t size, std::vector<std::int32_t> part_ids) {
  core::FileRecord record;
  record.id = "7";
  record.name = "movie.mkv";
  record.mime_type = "video/x-matroska";
  record.size = size;
  record.container_id = 55;
  record.part_ids = std::move(part_ids);
  return record;
}

} // namespace

class PartResolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
    ON_CALL(api, identity()).WillByDefault(Return("mock"));
    ON_CALL(api, resolve_container(55)).WillByDefault(Return(remote::ContainerHandle{55, 9}));
  }

  MockFileRepository repository;
  ::testing::NiceMock<MockChunkApi> api;
  MetadataCache cache{std::chrono::milliseconds::zero()};
  PartResolver resolver{repository, cache};
};

TEST_F(PartResolverTest, ResolvesAndCachesFileRecord) {
  EXPECT_CALL(repository, find("7")).Times(1).WillOnce(Return(make_record(10, {1})));

  EXPECT_EQ(resolver.resolve_file("7").name, "movie.mkv");
  EXPECT_EQ(resolver.resolve_file("7").size, 10);
}

TEST_F(PartResolverTest, UnknownFileIsNotFoundAndNotCached) {
  EXPECT_CALL(repository, find("missing")).Times(2).WillRepeatedly(Return(std::nullopt));

  EXPECT_THROW(resolver.resolve_file("missing"), core::NotFoundError);
  EXPECT_THROW(resolver.resolve_file("missing"), core::NotFoundError);
}

TEST_F(PartResolverTest, OrdersPartsByRecordIds) {
  auto record = make_record(25, {3, 1, 2});

  EXPECT_CALL(api, resolve_container(55)).Times(1);
  EXPECT_CALL(api, get_messages(_, record.part_ids))
    .Times(1)
    .WillOnce(Return(std::vector<remote::MessageVariant>{
      document_message(1, 501, 10),
      document_message(2, 502, 5),
      document_message(3, 503, 10),
    }));

  auto parts = resolver.resolve_parts(api, record);
  ASSERT_EQ(parts.size(), 3);
  EXPECT_EQ(parts[0].location.id, 503);
  EXPECT_EQ(parts[1].location.id, 501);
  EXPECT_EQ(parts[2].location.id, 502);
  EXPECT_EQ(parts[2].local_end, 4);

  // Second resolution is served from the cache
  auto again = resolver.resolve_parts(api, record);
  EXPECT_EQ(again.size(), 3);
}

TEST_F(PartResolverTest, FileWithoutPartsNeedsNoBackend) {
  EXPECT_CALL(api, resolve_container(_)).Times(0);
  EXPECT_CALL(api, get_messages(_, _)).Times(0);

  EXPECT_TRUE(resolver.resolve_parts(api, make_record(0, {})).empty());
}

TEST_F(PartResolverTest, DescriptorCarriesRecordFields) {
  auto record = make_record(10, {1});
  EXPECT_CALL(api, get_messages(_, _))
    .WillOnce(Return(std::vector<remote::MessageVariant>{document_message(1, 501, 10)}));

  auto descriptor = resolver.resolve_descriptor(api, record);
  EXPECT_EQ(descriptor.id, "7");
  EXPECT_EQ(descriptor.mime_type, "video/x-matroska");
  EXPECT_EQ(descriptor.total_size, 10);
  ASSERT_EQ(descriptor.parts.size(), 1);
}

TEST_F(PartResolverTest, UpstreamFailureIsRetriedNextTime) {
  auto record = make_record(10, {1});
  EXPECT_CALL(api, get_messages(_, _))
    .WillOnce([](const remote::ContainerHandle&, const std::vector<std::int32_t>&)
                -> std::vector<remote::MessageVariant> { throw core::UpstreamError("timeout"); })
    .WillOnce(Return(std::vector<remote::MessageVariant>{document_message(1, 501, 10)}));

  EXPECT_THROW(resolver.resolve_parts(api, record), core::UpstreamError);
  EXPECT_EQ(resolver.resolve_parts(api, record).size(), 1);
}

TEST_F(PartResolverTest, UnexpectedVariantsAreUpstreamErrors) {
  auto record = make_record(10, {1});

  const std::vector<remote::MessageVariant> bad_messages[] = {
    {remote::MessageEmpty{1}},
    {remote::MessageService{1, "pin"}},
    {remote::Message{1, remote::MediaEmpty{}}},
    {remote::Message{1, remote::MediaPhoto{12}}},
    {remote::Message{1, remote::MediaDocument{remote::DocumentEmpty{501}}}},
  };

  for (const auto& messages : bad_messages) {
    EXPECT_THROW(PartResolver::decode_parts(record, messages), core::UpstreamError);
  }
}

TEST_F(PartResolverTest, InconsistentPartsAreUpstreamErrors) {
  // Missing message
  EXPECT_THROW(PartResolver::decode_parts(make_record(20, {1, 2}), {document_message(1, 501, 10)}),
               core::UpstreamError);
  // Sizes do not add up to the record
  EXPECT_THROW(PartResolver::decode_parts(make_record(30, {1, 2}),
                                          {document_message(1, 501, 10), document_message(2, 502, 10)}),
               core::UpstreamError);
  // Non-last part shorter than the first
  EXPECT_THROW(PartResolver::decode_parts(make_record(15, {1, 2, 3}),
                                          {document_message(1, 501, 10), document_message(2, 502, 2),
                                           document_message(3, 503, 3)}),
               core::UpstreamError);
  // Last part longer than the first
  EXPECT_THROW(PartResolver::decode_parts(make_record(22, {1, 2}),
                                          {document_message(1, 501, 10), document_message(2, 502, 12)}),
               core::UpstreamError);
}
