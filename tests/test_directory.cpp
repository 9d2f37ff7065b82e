#include <cstdint>
#include <vector>

#include "archive_builder.hpp"
#include "pmtiles.h"

#include <gtest/gtest.h>

using pmtiles::Entry;
using pmtiles::find_entry;

namespace {

std::vector<std::byte> bytes(std::initializer_list<int> values) {
  std::vector<std::byte> out;
  for (int v : values) {
    out.push_back(static_cast<std::byte>(v));
  }
  return out;
}

} // namespace

TEST(HeaderTest, ParsesAllFields) {
  test_support::ArchiveBuilder builder(pmtiles::Compression::GZIP);
  builder.setTileType(pmtiles::TileType::MVT);
  builder.setRoot({builder.dataEntry(0, "tile")});
  builder.setMetadata("{}");
  const auto archive = builder.build();

  const std::vector<std::byte> headerBytes(archive.begin(), archive.begin() + pmtiles::kHeaderLength);
  const auto h = pmtiles::deserialize_header(headerBytes);

  EXPECT_EQ(h.root_dir_offset, 127u);
  EXPECT_GT(h.root_dir_length, 0u);
  EXPECT_EQ(h.json_metadata_offset, h.root_dir_offset + h.root_dir_length);
  EXPECT_EQ(h.leaf_dirs_offset, h.json_metadata_offset + h.json_metadata_length);
  EXPECT_EQ(h.leaf_dirs_length, 0u);
  EXPECT_EQ(h.tile_data_offset, h.leaf_dirs_offset);
  EXPECT_EQ(h.tile_data_length, 4u);
  EXPECT_EQ(h.addressed_tiles_count, 5u);
  EXPECT_EQ(h.tile_entries_count, 4u);
  EXPECT_EQ(h.tile_contents_count, 3u);
  EXPECT_TRUE(h.clustered);
  EXPECT_EQ(h.internal_compression, pmtiles::Compression::GZIP);
  EXPECT_EQ(h.tile_compression, pmtiles::Compression::NONE);
  EXPECT_EQ(h.tile_type, pmtiles::TileType::MVT);
  EXPECT_EQ(h.min_zoom, 0);
  EXPECT_EQ(h.max_zoom, 14);
  EXPECT_EQ(h.min_lon_e7, -1800000000);
  EXPECT_EQ(h.min_lat_e7, -850511287);
  EXPECT_EQ(h.max_lon_e7, 1800000000);
  EXPECT_EQ(h.max_lat_e7, 850511287);
  EXPECT_EQ(h.center_zoom, 3);
  EXPECT_DOUBLE_EQ(h.centerLon(), 13.4);
  EXPECT_DOUBLE_EQ(h.centerLat(), 52.5);
  EXPECT_DOUBLE_EQ(h.lonMin(), -180.0);
}

TEST(HeaderTest, RejectsTruncatedHeader) {
  EXPECT_THROW(pmtiles::deserialize_header(test_support::to_bytes("PMTiles")), pmtiles::header_parse_error);
}

TEST(HeaderTest, RejectsBadMagic) {
  std::vector<std::byte> data(pmtiles::kHeaderLength, std::byte{0});
  EXPECT_THROW(pmtiles::deserialize_header(data), pmtiles::header_parse_error);
}

TEST(HeaderTest, RejectsOtherVersions) {
  test_support::ArchiveBuilder builder;
  builder.setRoot({builder.dataEntry(0, "tile")});
  auto data = builder.build();
  data.resize(pmtiles::kHeaderLength);
  data[7] = std::byte{2};
  EXPECT_THROW(pmtiles::deserialize_header(data), pmtiles::header_parse_error);
}

TEST(DirectoryTest, DecodesHandWrittenDirectory) {
  // 2 entries, ids 1 and 3, runs 1 and 0, lengths 10 and 20,
  // offsets 0 (explicit) and 10 (contiguous, encoded as 0)
  const auto entries = pmtiles::deserialize_directory(bytes({2, 1, 2, 1, 0, 10, 20, 1, 0}));

  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].tile_id, 1u);
  EXPECT_EQ(entries[0].run_length, 1u);
  EXPECT_EQ(entries[0].length, 10u);
  EXPECT_EQ(entries[0].offset, 0u);
  EXPECT_FALSE(entries[0].isLeaf());

  EXPECT_EQ(entries[1].tile_id, 3u);
  EXPECT_TRUE(entries[1].isLeaf());
  EXPECT_EQ(entries[1].length, 20u);
  EXPECT_EQ(entries[1].offset, 10u);
}

TEST(DirectoryTest, DecodesMultiByteVarints) {
  // tile id 300 = 0xAC 0x02, offset 1000 + 1 = 0xE9 0x07
  const auto entries = pmtiles::deserialize_directory(bytes({1, 0xAC, 0x02, 5, 7, 0xE9, 0x07}));

  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].tile_id, 300u);
  EXPECT_EQ(entries[0].run_length, 5u);
  EXPECT_EQ(entries[0].length, 7u);
  EXPECT_EQ(entries[0].offset, 1000u);
}

TEST(DirectoryTest, DecodesNonContiguousOffsets) {
  const std::vector<Entry> written = {
      {0, 0, 100, 1}, {1, 100, 50, 1}, {5, 0, 100, 3}, {9, 4096, 12, 0}};
  const auto entries = pmtiles::deserialize_directory(test_support::serialize_directory(written));

  ASSERT_EQ(entries.size(), written.size());
  for (std::size_t i = 0; i < written.size(); ++i) {
    EXPECT_EQ(entries[i].tile_id, written[i].tile_id) << "entry " << i;
    EXPECT_EQ(entries[i].offset, written[i].offset) << "entry " << i;
    EXPECT_EQ(entries[i].length, written[i].length) << "entry " << i;
    EXPECT_EQ(entries[i].run_length, written[i].run_length) << "entry " << i;
  }
}

TEST(DirectoryTest, EmptyDirectory) {
  EXPECT_TRUE(pmtiles::deserialize_directory(bytes({0})).empty());
}

TEST(DirectoryTest, RejectsTruncatedBuffer) {
  EXPECT_THROW(pmtiles::deserialize_directory(bytes({2, 1, 2, 1})), pmtiles::directory_parse_error);
  EXPECT_THROW(pmtiles::deserialize_directory(bytes({1, 0x80})), pmtiles::directory_parse_error);
  EXPECT_THROW(pmtiles::deserialize_directory({}), pmtiles::directory_parse_error);
}

TEST(DirectoryTest, RejectsTrailingBytes) {
  EXPECT_THROW(pmtiles::deserialize_directory(bytes({1, 0, 1, 1, 1, 99})), pmtiles::directory_parse_error);
}

TEST(DirectoryTest, RejectsOverlongVarint) {
  EXPECT_THROW(pmtiles::deserialize_directory(
                   bytes({0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x01})),
               pmtiles::directory_parse_error);
}

class FindEntryTest : public ::testing::Test {
protected:
  // a data run over ids 10..14 and a leaf pointer at 20
  std::vector<Entry> entries_ = {{10, 0, 100, 5}, {20, 0, 64, 0}};
};

TEST_F(FindEntryTest, ExactMatch) {
  const auto entry = find_entry(entries_, 10);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->tile_id, 10u);
}

TEST_F(FindEntryTest, InsideRun) {
  const auto entry = find_entry(entries_, 14);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->tile_id, 10u);
}

TEST_F(FindEntryTest, PastRunBeforeLeafIsAbsent) {
  EXPECT_FALSE(find_entry(entries_, 15).has_value());
  EXPECT_FALSE(find_entry(entries_, 19).has_value());
}

TEST_F(FindEntryTest, LeafCoversEverythingAfterIt) {
  const auto exact = find_entry(entries_, 20);
  ASSERT_TRUE(exact.has_value());
  EXPECT_TRUE(exact->isLeaf());

  const auto beyond = find_entry(entries_, 1000000);
  ASSERT_TRUE(beyond.has_value());
  EXPECT_EQ(beyond->tile_id, 20u);
}

TEST_F(FindEntryTest, BelowAllEntriesIsAbsent) {
  EXPECT_FALSE(find_entry(entries_, 5).has_value());
  EXPECT_FALSE(find_entry(entries_, 0).has_value());
}

TEST(FindEntryLeafGapTest, LeafCoversTheGapUpToTheNextEntry) {
  // data run 10..14 followed by a leaf at 15
  const std::vector<Entry> entries = {{10, 0, 100, 5}, {15, 0, 64, 0}};

  const auto entry = find_entry(entries, 15);
  ASSERT_TRUE(entry.has_value());
  EXPECT_TRUE(entry->isLeaf());
  EXPECT_EQ(entry->tile_id, 15u);

  const auto inRun = find_entry(entries, 14);
  ASSERT_TRUE(inRun.has_value());
  EXPECT_EQ(inRun->tile_id, 10u);
}

TEST(FindEntryLeafGapTest, LeafBeforeDataRun) {
  const std::vector<Entry> entries = {{0, 0, 64, 0}, {100, 0, 10, 1}};

  const auto entry = find_entry(entries, 42);
  ASSERT_TRUE(entry.has_value());
  EXPECT_TRUE(entry->isLeaf());
  EXPECT_EQ(entry->tile_id, 0u);
}

TEST(FindEntryEmptyTest, NothingToFind) {
  EXPECT_FALSE(find_entry({}, 0).has_value());
}

TEST(FindEntryLargeTest, BinarySearchOverManyEntries) {
  std::vector<Entry> entries;
  for (uint64_t i = 0; i < 1000; ++i) {
    entries.push_back(Entry{i * 10, i * 7, 7, 3});
  }

  for (uint64_t i = 0; i < 1000; ++i) {
    for (uint64_t delta = 0; delta < 3; ++delta) {
      const auto entry = find_entry(entries, i * 10 + delta);
      ASSERT_TRUE(entry.has_value());
      EXPECT_EQ(entry->tile_id, i * 10);
    }
    EXPECT_FALSE(find_entry(entries, i * 10 + 3).has_value());
  }
}
