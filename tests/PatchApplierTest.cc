#include <gtest/gtest.h>

#include "PatchApplier.hh"

using namespace std;
using namespace ToyBinDASM;

TEST(PatchApplierTest, ExactRequiresMatchingSize) {
  ByteBuffer buf(string(8, 'x'));
  PatchApplier patcher(buf);
  EXPECT_EQ(PatchResult::REJECTED_SIZE, patcher.apply_exact(2, "ab", 3));
  EXPECT_EQ(string(8, 'x'), buf.contents());
  EXPECT_EQ(PatchResult::WRITTEN, patcher.apply_exact(2, "abc", 3));
  EXPECT_EQ("xxabcxxx", buf.contents());
  EXPECT_EQ(PatchResult::REJECTED_BOUNDS, patcher.apply_exact(7, "ab", 2));
  EXPECT_EQ(8, buf.size());
}

TEST(PatchApplierTest, FittedPolicies) {
  {
    ByteBuffer buf(string(8, 'x'));
    PatchApplier patcher(buf);
    EXPECT_EQ(PatchResult::REJECTED_SIZE, patcher.apply_fitted(0, "abcde", 4, FitPolicy::REJECT));
    EXPECT_EQ(PatchResult::WRITTEN, patcher.apply_fitted(0, "ab", 4, FitPolicy::REJECT));
    EXPECT_EQ("abxxxxxx", buf.contents());
  }
  {
    ByteBuffer buf(string(8, 'x'));
    PatchApplier patcher(buf);
    EXPECT_EQ(PatchResult::TRUNCATED, patcher.apply_fitted(0, "abcde", 4, FitPolicy::TRUNCATE));
    EXPECT_EQ("abcdxxxx", buf.contents());
  }
  {
    ByteBuffer buf(string(8, 'x'));
    PatchApplier patcher(buf);
    EXPECT_EQ(PatchResult::REJECTED_SIZE, patcher.apply_fitted(0, "abcde", 4, FitPolicy::PAD));
    EXPECT_EQ(PatchResult::PADDED, patcher.apply_fitted(0, "ab", 4, FitPolicy::PAD, '.'));
    EXPECT_EQ("ab..xxxx", buf.contents());
  }
  {
    ByteBuffer buf(string(8, 'x'));
    PatchApplier patcher(buf);
    EXPECT_EQ(PatchResult::PADDED, patcher.apply_fitted(4, "a", 4, FitPolicy::PAD_OR_TRUNCATE));
    EXPECT_EQ(string("xxxxa\0\0\0", 8), buf.contents());
    EXPECT_EQ(PatchResult::TRUNCATED, patcher.apply_fitted(0, "abcdef", 2, FitPolicy::PAD_OR_TRUNCATE));
    EXPECT_EQ(PatchResult::WRITTEN, patcher.apply_fitted(2, "yy", 2, FitPolicy::PAD_OR_TRUNCATE));
    EXPECT_EQ(string("abyya\0\0\0", 8), buf.contents());
    EXPECT_EQ(PatchResult::REJECTED_BOUNDS, patcher.apply_fitted(6, "a", 4, FitPolicy::PAD_OR_TRUNCATE));
  }
}

TEST(PatchApplierTest, BufferSizeNeverChanges) {
  ByteBuffer buf(string(16, '\0'));
  PatchApplier patcher(buf);
  EXPECT_EQ(PatchResult::TRUNCATED, patcher.apply_fitted(12, string(10, 'z'), 4, FitPolicy::TRUNCATE));
  EXPECT_EQ(PatchResult::REJECTED_BOUNDS, patcher.apply_in_place(15, "zz"));
  EXPECT_EQ(PatchResult::REJECTED_BOUNDS, patcher.apply_u16l(15, 0x1234));
  EXPECT_EQ(PatchResult::REJECTED_BOUNDS, patcher.apply_exact(14, "zzz", 3));
  EXPECT_EQ(16, buf.size());
  EXPECT_EQ(string(12, '\0') + "zzzz", buf.contents());
}

TEST(PatchApplierTest, InPlaceAndU16) {
  ByteBuffer buf(string(4, '\0'));
  PatchApplier patcher(buf);
  EXPECT_EQ(PatchResult::WRITTEN, patcher.apply_u16l(2, 0xBEEF));
  EXPECT_EQ(0xBEEF, buf.u16l(2));
  EXPECT_EQ(PatchResult::REJECTED_BOUNDS, patcher.apply_u16l(3, 0));
  EXPECT_EQ(PatchResult::REJECTED_BOUNDS, patcher.apply_in_place(2, "abc"));
  EXPECT_EQ(1, patcher.write_count());
}

TEST(PatchApplierTest, DryRunCountsButDoesNotWrite) {
  ByteBuffer buf(string(4, 'x'));
  PatchApplier patcher(buf, true);
  EXPECT_TRUE(patcher.is_dry_run());
  EXPECT_EQ(PatchResult::WRITTEN, patcher.apply_in_place(0, "ab"));
  EXPECT_EQ(PatchResult::PADDED, patcher.apply_fitted(0, "a", 4, FitPolicy::PAD));
  EXPECT_EQ(2, patcher.write_count());
  EXPECT_EQ("xxxx", buf.contents());
}

TEST(PatchApplierTest, Summary) {
  PatchSummary summary;
  summary.add(PatchResult::WRITTEN);
  summary.add(PatchResult::TRUNCATED);
  summary.add(PatchResult::PADDED);
  summary.add(PatchResult::REJECTED_SIZE);
  summary.skip("something");
  EXPECT_EQ("3 updated, 2 skipped, 1 trimmed, 1 padded", summary.str());

  PatchSummary other;
  other.skip("else");
  summary.merge(other);
  EXPECT_EQ(3, summary.skipped);
  EXPECT_EQ((vector<string>{"something", "else"}), summary.messages);
}

TEST(PatchApplierTest, ByteBufferBoundsChecks) {
  ByteBuffer buf(string("\x01\x02\x03", 3));
  EXPECT_EQ(0x0201, buf.u16l(0));
  EXPECT_THROW(buf.u16l(2), out_of_range);
  EXPECT_THROW(buf.read(1, 3), out_of_range);
  EXPECT_THROW(buf.put_u8(3, 0), out_of_range);
  EXPECT_TRUE(buf.contains(3, 0));
  EXPECT_FALSE(buf.contains(4, 0));
  EXPECT_FALSE(buf.contains(1, static_cast<size_t>(-1)));
}
