#include <gtest/gtest.h>

#include "StatTable.hh"

using namespace std;
using namespace ToyBinDASM;

static StatTableConfig d3_config() {
  return StatTableConfig{
      .layout = StatTableLayout::D3_WORD_STREAM,
      .base_offset = 4,
      .record_size = 10,
      .record_count = 3,
      .first_string_index = 2,
      .max_power = 225,
  };
}

// Word w of the stream holds 100 + w; the 2 bytes after each record's words
// are 0xEE
static ByteBuffer d3_buffer() {
  ByteBuffer buf(string(4 + 3 * 10, '\xEE'));
  for (size_t w = 0; w < 12; w++) {
    buf.put_u16l(4 + (w / 4) * 10 + (w % 4) * 2, 100 + w);
  }
  return buf;
}

static StatTableConfig digivice_config() {
  return StatTableConfig{
      .layout = StatTableLayout::DIGIVICE_SPLIT_RECORDS,
      .base_offset = 0,
      .record_size = 10,
      .record_count = 5,
      .first_string_index = 0,
      .max_power = 225,
  };
}

static ByteBuffer digivice_buffer() {
  ByteBuffer buf(string(60, '\0'));
  buf.put_u16l(4, 7);
  buf.put_u16l(10, 40);
  buf.put_u16l(14, 8);
  buf.put_u16l(20, 60);
  return buf;
}

TEST(StatTableTest, ReadD3WordStream) {
  auto buf = d3_buffer();
  auto rows = read_partner_stats(buf, d3_config());
  ASSERT_EQ(2, rows.size());

  EXPECT_EQ(0, rows[0].slot);
  EXPECT_EQ(2, rows[0].string_index);
  EXPECT_EQ(100, rows[0].stage);
  EXPECT_EQ(101, rows[0].unknown1);
  EXPECT_EQ(102, rows[0].power);
  EXPECT_EQ(103, rows[0].unknown2);
  EXPECT_EQ(4, rows[0].offset);

  // The second partner's words straddle the gap between records
  EXPECT_EQ(1, rows[1].slot);
  EXPECT_EQ(104, rows[1].string_index);
  EXPECT_EQ(105, rows[1].stage);
  EXPECT_EQ(106, rows[1].unknown1);
  EXPECT_EQ(107, rows[1].power);
  EXPECT_EQ(108, rows[1].unknown2);
  EXPECT_EQ(14, rows[1].offset);
}

TEST(StatTableTest, ReadD3RejectsShortBuffer) {
  ByteBuffer buf(string(20, '\0'));
  EXPECT_THROW(read_partner_stats(buf, d3_config()), out_of_range);
}

TEST(StatTableTest, WriteD3KeepsPowerAboveLimit) {
  auto buf = d3_buffer();
  auto rows = read_partner_stats(buf, d3_config());
  rows[0].power = 300;
  rows[1].power = 50;
  rows[1].stage = 3;

  PatchApplier patcher(buf);
  auto summary = write_partner_stats(patcher, d3_config(), rows);
  EXPECT_EQ(1, summary.updated);
  EXPECT_EQ(1, summary.skipped);
  EXPECT_EQ(34, buf.size());

  auto reread = read_partner_stats(buf, d3_config());
  EXPECT_EQ(102, reread[0].power);
  EXPECT_EQ(50, reread[1].power);
  EXPECT_EQ(3, reread[1].stage);
  // Words past the last partner keep their values
  EXPECT_EQ(111, buf.u16l(4 + 2 * 10 + 3 * 2));
  // Bytes between records are untouched
  EXPECT_EQ(0xEEEE, buf.u16l(4 + 8));
  EXPECT_EQ(0xEEEE, buf.u16l(4 + 18));
}

TEST(StatTableTest, ReadDigiviceSplitRecords) {
  auto buf = digivice_buffer();
  auto rows = read_partner_stats(buf, digivice_config());
  ASSERT_EQ(2, rows.size());
  EXPECT_EQ(0, rows[0].slot);
  EXPECT_EQ(7, rows[0].string_index);
  EXPECT_EQ(40, rows[0].power);
  EXPECT_EQ(0, rows[0].offset);
  EXPECT_EQ(1, rows[1].slot);
  EXPECT_EQ(8, rows[1].string_index);
  EXPECT_EQ(60, rows[1].power);
  EXPECT_EQ(10, rows[1].offset);
}

TEST(StatTableTest, ReadDigiviceStopsAtBufferEnd) {
  ByteBuffer buf(string(25, '\x01'));
  auto rows = read_partner_stats(buf, digivice_config());
  EXPECT_EQ(1, rows.size());
}

TEST(StatTableTest, WriteDigivicePower) {
  auto buf = digivice_buffer();
  auto rows = read_partner_stats(buf, digivice_config());
  rows[0].power = 300;
  rows[1].power = 70;
  rows.emplace_back(PartnerStats{.slot = 9, .string_index = 1, .stage = 0, .power = 1, .unknown1 = 0, .unknown2 = 0, .offset = 0});

  PatchApplier patcher(buf);
  auto summary = write_partner_stats(patcher, digivice_config(), rows);
  EXPECT_EQ(1, summary.updated);
  EXPECT_EQ(2, summary.skipped);
  EXPECT_EQ(40, buf.u16l(10));
  EXPECT_EQ(70, buf.u16l(20));
  // String indexes are not written
  EXPECT_EQ(7, buf.u16l(4));
  EXPECT_EQ(60, buf.size());
}
