#include <gtest/gtest.h>

#include "TestHelpers.hh"
#include "TextArchive.hh"

using namespace std;
using namespace ToyBinDASM;
using namespace ToyBinDASM::Test;

TEST(TextArchiveTest, ParsesOffsetsAndCapacities) {
  ByteBuffer buf(text_archive_bytes({ascii_codes("ABC"), {}}));
  ASSERT_EQ(16, buf.size());

  auto text = try_parse_text_archive(buf, 0, buf.size(), "loc");
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ("loc", text->location);
  ASSERT_EQ(2, text->string_count());
  EXPECT_EQ(3, text->word_offsets[0]);
  EXPECT_EQ(7, text->word_offsets[1]);
  EXPECT_EQ(6, text->string_offset(0));
  EXPECT_EQ(8, text->string_capacity(0));
  EXPECT_EQ(2, text->string_capacity(1));
  EXPECT_EQ(ascii_codes("ABC"), decode_string_codes(buf, *text, 0));
  EXPECT_TRUE(decode_string_codes(buf, *text, 1).empty());
}

TEST(TextArchiveTest, OccupiedSizeStopsAtTerminator) {
  ByteBuffer buf(text_archive_bytes({ascii_codes("AB"), ascii_codes("C")}, 2));
  auto text = try_parse_text_archive(buf, 0, buf.size());
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(10, text->string_capacity(0));
  EXPECT_EQ(6, text->string_occupied_size(buf, 0));
}

TEST(TextArchiveTest, ControlCodesAreDropped) {
  ByteBuffer buf(text_archive_bytes({{0x0041, 0xF001, 0x0042, 0xFFFF}}));
  auto text = try_parse_text_archive(buf, 0, buf.size());
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(ascii_codes("AB"), decode_string_codes(buf, *text, 0));
}

TEST(TextArchiveTest, RejectsZeroCount) {
  ByteBuffer buf(string(8, '\0'));
  EXPECT_FALSE(try_parse_text_archive(buf, 0, buf.size()).has_value());
}

TEST(TextArchiveTest, RejectsDecreasingOffsets) {
  string data = text_archive_bytes({ascii_codes("A"), ascii_codes("B")});
  // Swap the two offsets
  swap(data[2], data[4]);
  swap(data[3], data[5]);
  ByteBuffer buf(std::move(data));
  EXPECT_FALSE(try_parse_text_archive(buf, 0, buf.size()).has_value());
}

TEST(TextArchiveTest, RejectsOffsetBeyondEnd) {
  phosg::StringWriter w;
  w.put_u16l(1);
  w.put_u16l(100);
  w.put_u16l(0);
  ByteBuffer buf(w.str());
  EXPECT_FALSE(try_parse_text_archive(buf, 0, buf.size()).has_value());
}

TEST(TextArchiveTest, RejectsUnterminatedString) {
  phosg::StringWriter w;
  w.put_u16l(1);
  w.put_u16l(2);
  w.put_u16l(0x0041);
  w.put_u16l(0x0042);
  ByteBuffer buf(w.str());
  EXPECT_FALSE(try_parse_text_archive(buf, 0, buf.size()).has_value());
}

TEST(TextArchiveTest, RejectsCountBeyondData) {
  phosg::StringWriter w;
  w.put_u16l(50);
  w.put_u16l(0);
  ByteBuffer buf(w.str());
  EXPECT_FALSE(try_parse_text_archive(buf, 0, buf.size()).has_value());
}

TEST(TextArchiveTest, EncodeStringCodesAppendsTerminator) {
  EXPECT_EQ(string("A\0B\0\0\0", 6), encode_string_codes(ascii_codes("AB")));
  EXPECT_EQ(string("\0\0", 2), encode_string_codes({}));
}

TEST(TextArchiveTest, EncodeForSlot) {
  auto codes = ascii_codes("ABC");
  EXPECT_EQ(string("A\0B\0C\0\0\0", 8), encode_for_slot(codes, 8, OverflowPolicy::REJECT).value());
  EXPECT_EQ(string("A\0B\0C\0\0\0", 8), encode_for_slot(codes, 10, OverflowPolicy::REJECT).value());
  EXPECT_FALSE(encode_for_slot(codes, 6, OverflowPolicy::REJECT).has_value());
  EXPECT_EQ(string("A\0B\0\0\0", 6), encode_for_slot(codes, 6, OverflowPolicy::TRUNCATE).value());
  EXPECT_EQ(string("A\0\0\0", 4), encode_for_slot(codes, 5, OverflowPolicy::TRUNCATE).value());
  EXPECT_FALSE(encode_for_slot(codes, 1, OverflowPolicy::TRUNCATE).has_value());
}

TEST(TextArchiveTest, ParseOverflowPolicy) {
  EXPECT_EQ(OverflowPolicy::REJECT, parse_overflow_policy("reject"));
  EXPECT_EQ(OverflowPolicy::REJECT, parse_overflow_policy("error"));
  EXPECT_EQ(OverflowPolicy::TRUNCATE, parse_overflow_policy("truncate"));
  EXPECT_THROW(parse_overflow_policy("grow"), invalid_argument);
}

TEST(TextArchiveTest, FindSkipsCompressedEntries) {
  string text = text_archive_bytes({ascii_codes("A")});
  size_t header_size = archive_header_size(2);
  string data = archive_bytes({
      ArchiveEntry{1, static_cast<uint32_t>(header_size), static_cast<uint32_t>(text.size()), static_cast<uint32_t>(text.size())},
      ArchiveEntry{0, static_cast<uint32_t>(header_size), static_cast<uint32_t>(text.size()), static_cast<uint32_t>(text.size())},
  });
  data += text;
  ByteBuffer buf(std::move(data));

  auto archives = scan_archives(buf);
  ASSERT_EQ(1, archives.size());
  auto texts = find_text_archives(buf, archives[0]);
  ASSERT_EQ(1, texts.size());
  EXPECT_EQ("off=0x0/idx=1", texts[0].location);
}
