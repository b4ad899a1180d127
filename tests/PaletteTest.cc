#include <gtest/gtest.h>

#include <phosg/Image.hh>

#include "Palette.hh"

using namespace std;
using namespace ToyBinDASM;

TEST(PaletteTest, DecodeNormal) {
  EXPECT_EQ(0x000000FF, decode_argb1555(0x8000, AlphaPolarity::NORMAL));
  EXPECT_EQ(0x00000000, decode_argb1555(0x0000, AlphaPolarity::NORMAL));
  EXPECT_EQ(0xFFFFFF00, decode_argb1555(0x7FFF, AlphaPolarity::NORMAL));
  EXPECT_EQ(0xFFFF00FF, decode_argb1555(0xFFE0, AlphaPolarity::NORMAL));
  EXPECT_EQ(0xFF0000FF, decode_argb1555(0xFC00, AlphaPolarity::NORMAL));
}

TEST(PaletteTest, DecodeInverted) {
  EXPECT_EQ(0x00000000, decode_argb1555(0x8000, AlphaPolarity::INVERTED));
  EXPECT_EQ(0x000000FF, decode_argb1555(0x0000, AlphaPolarity::INVERTED));
  EXPECT_EQ(0xFFFFFFFF, decode_argb1555(0x7FFF, AlphaPolarity::INVERTED));
}

TEST(PaletteTest, PolaritiesAgreeOnColorAndDisagreeOnAlpha) {
  for (uint16_t color : {0x0000, 0x7FFF, 0x8000, 0xFC00, 0x1234, 0xABCD}) {
    uint32_t normal = decode_argb1555(color, AlphaPolarity::NORMAL);
    uint32_t inverted = decode_argb1555(color, AlphaPolarity::INVERTED);
    EXPECT_EQ(normal & 0xFFFFFF00, inverted & 0xFFFFFF00);
    EXPECT_EQ(0xFF, phosg::get_a(normal) ^ phosg::get_a(inverted));
  }
}

TEST(PaletteTest, EncodeInvertsDecode) {
  for (uint16_t color : {0x0000, 0x7FFF, 0x8000, 0xFC00, 0x1234, 0xABCD, 0x0421}) {
    EXPECT_EQ(color, encode_argb1555(decode_argb1555(color, AlphaPolarity::NORMAL), AlphaPolarity::NORMAL));
    EXPECT_EQ(color, encode_argb1555(decode_argb1555(color, AlphaPolarity::INVERTED), AlphaPolarity::INVERTED));
  }
}

TEST(PaletteTest, EncodeRoundsToNearest) {
  EXPECT_EQ(0x8000 | (1 << 10), encode_argb1555(phosg::rgba8888(9, 0, 0, 0xFF), AlphaPolarity::NORMAL));
  EXPECT_EQ(0x0000, encode_argb1555(phosg::rgba8888(3, 0, 0, 0x7F), AlphaPolarity::NORMAL));
  EXPECT_EQ(0x8000, encode_argb1555(phosg::rgba8888(3, 0, 0, 0x7F), AlphaPolarity::INVERTED));
}

TEST(PaletteTest, GuessPolarity) {
  vector<uint16_t> palette = {0x8000, 0x8421, 0xFFFF, 0x0000, 0x1111, 0x2222, 0x3333, 0x4444};
  EXPECT_EQ(AlphaPolarity::NORMAL, guess_alpha_polarity(palette, 0, 4));
  EXPECT_EQ(AlphaPolarity::INVERTED, guess_alpha_polarity(palette, 4, 4));
  // A tie prefers normal
  EXPECT_EQ(AlphaPolarity::NORMAL, guess_alpha_polarity(palette, 2, 2));
  EXPECT_EQ(AlphaPolarity::NORMAL, guess_alpha_polarity({}, 0, 4));
}

TEST(PaletteTest, GuessClampsToPaletteEnd) {
  vector<uint16_t> palette = {0x8000, 0x8000, 0x0000, 0x0000, 0x0000};
  EXPECT_EQ(AlphaPolarity::INVERTED, guess_alpha_polarity(palette, 10, 3));
}

TEST(PaletteTest, ResolvePolarity) {
  vector<uint16_t> palette = {0x0000, 0x0000};
  EXPECT_EQ(AlphaPolarity::NORMAL, resolve_alpha_polarity(AlphaMode::NORMAL, palette, 0, 2));
  EXPECT_EQ(AlphaPolarity::INVERTED, resolve_alpha_polarity(AlphaMode::INVERTED, palette, 0, 2));
  EXPECT_EQ(AlphaPolarity::INVERTED, resolve_alpha_polarity(AlphaMode::AUTO, palette, 0, 2));
}

TEST(PaletteTest, ParseAlphaMode) {
  EXPECT_EQ(AlphaMode::AUTO, parse_alpha_mode("auto"));
  EXPECT_EQ(AlphaMode::NORMAL, parse_alpha_mode("normal"));
  EXPECT_EQ(AlphaMode::INVERTED, parse_alpha_mode("inverted"));
  EXPECT_STREQ("inverted", name_for_alpha_mode(AlphaMode::INVERTED));
  EXPECT_THROW(parse_alpha_mode("both"), invalid_argument);
}
