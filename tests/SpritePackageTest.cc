#include <gtest/gtest.h>

#include "SpritePackage.hh"
#include "TestHelpers.hh"

using namespace std;
using namespace ToyBinDASM;
using namespace ToyBinDASM::Test;

static SpritePackageLocatorConfig small_locator_config() {
  SpritePackageLocatorConfig config;
  config.min_images = 1;
  config.max_images = 10;
  config.min_colors = 4;
  return config;
}

static SpritePackageBuilder two_image_package(size_t num_colors = 4) {
  SpritePackageBuilder b;
  b.images = {{0, 1, 1, 0}, {2, 2, 1, 0}};
  b.sprites = {
      {0, 0, 0, sprite_attributes(2, 0, 0, 0)},
      {0, 0, 0, sprite_attributes(2, 0, 0, 1)},
      {0, 0, 0, sprite_attributes(2, 0, 0, 2)},
      {0, 8, 0, sprite_attributes(2, 0, 0, 2)},
  };
  b.palette.assign(num_colors, 0x8000);
  b.chars = string(16, '\0');
  return b;
}

TEST(SpritePackageTest, SpriteAttributesFields) {
  SpriteAttributes attrs(0xFABD);
  EXPECT_EQ(1, attrs.color_selector);
  EXPECT_EQ(4, attrs.bits_per_pixel());
  EXPECT_EQ(16, attrs.color_count());
  EXPECT_EQ(3, attrs.flip);
  EXPECT_TRUE(attrs.flip_h());
  EXPECT_TRUE(attrs.flip_v());
  EXPECT_EQ(3, attrs.width_selector);
  EXPECT_EQ(64, attrs.width());
  EXPECT_EQ(2, attrs.height_selector);
  EXPECT_EQ(32, attrs.height());
  EXPECT_EQ(0xA, attrs.palette_bank);
  EXPECT_EQ(3, attrs.depth);
  EXPECT_TRUE(attrs.blend);
  EXPECT_TRUE(attrs.extra);
  EXPECT_EQ(64 * 32 / 2, attrs.char_data_size());
}

TEST(SpritePackageTest, ReplacePaletteBank) {
  EXPECT_EQ(0xF5BD, replace_palette_bank(0xFABD, 5));
  EXPECT_THROW(replace_palette_bank(0, 16), invalid_argument);
}

TEST(SpritePackageTest, ParseTables) {
  auto b = two_image_package();
  ByteBuffer buf(string(8, '\0') + b.build());
  auto pkg = parse_sprite_package(buf, 8);

  EXPECT_EQ(8, pkg.base_offset);
  ASSERT_EQ(2, pkg.images.size());
  ASSERT_EQ(4, pkg.sprites.size());
  ASSERT_EQ(4, pkg.palette.size());
  EXPECT_EQ(2, pkg.images[1].sprite_start_index);
  EXPECT_EQ(2, pkg.images[1].width);
  EXPECT_EQ(8, pkg.sprites[3].offset_x);
  EXPECT_EQ(0x8000, pkg.palette[0]);
  EXPECT_EQ(8 + b.chars_offset(), pkg.char_data_offset(pkg.sprites[0]));
  EXPECT_EQ(8 + b.palettes_offset() + 6, pkg.palette_entry_offset(3));
  EXPECT_THROW(pkg.palette_entry_offset(4), out_of_range);
  EXPECT_EQ(8 + b.sprite_defs_offset() + 3 * 8 + 6, pkg.sprite_attributes_offset(3));
  EXPECT_THROW(pkg.sprite_attributes_offset(4), out_of_range);
}

TEST(SpritePackageTest, SubimageCounts) {
  auto b = two_image_package();
  ByteBuffer buf(b.build());
  auto pkg = parse_sprite_package(buf, 0);

  // Image 0 owns sprites 0-1 at one sprite per subimage; image 1 owns 2-3 at
  // two sprites per subimage
  EXPECT_EQ(2, pkg.subimage_count(0));
  EXPECT_EQ(1, pkg.subimage_count(1));
  EXPECT_EQ(1, pkg.first_sprite_index(0, 1));
  EXPECT_EQ(2, pkg.sprite_count(1, 0));
  EXPECT_EQ(0, pkg.sprite_count(1, 1));
}

TEST(SpritePackageTest, BankUsage) {
  ByteBuffer buf(two_image_package().build());
  auto pkg = parse_sprite_package(buf, 0);
  EXPECT_EQ((set<uint8_t>{0, 1, 2}), pkg.collect_bank_usage(0));
  EXPECT_EQ(3, pkg.choose_free_bank(0));
  EXPECT_TRUE(pkg.collect_bank_usage(1).empty());
  EXPECT_EQ(0, pkg.choose_free_bank(1));
}

TEST(SpritePackageTest, ParseRejectsGarbage) {
  ByteBuffer buf(string(64, '\xFF'));
  EXPECT_THROW(parse_sprite_package(buf, 0), runtime_error);
  EXPECT_THROW(parse_sprite_package(buf, 60), out_of_range);
}

TEST(SpritePackageTest, LocateFindsPackageAfterPadding) {
  ByteBuffer buf(string(12, '\0') + two_image_package().build() + string(8, '\0'));
  auto pkg = locate_sprite_package(buf, small_locator_config());
  EXPECT_EQ(12, pkg.base_offset);
  EXPECT_EQ(2, pkg.images.size());
}

TEST(SpritePackageTest, LocateHonorsLimits) {
  ByteBuffer buf(two_image_package().build());
  auto config = small_locator_config();
  config.min_colors = 8;
  EXPECT_THROW(locate_sprite_package(buf, config), runtime_error);
  config = small_locator_config();
  config.min_images = 3;
  EXPECT_THROW(locate_sprite_package(buf, config), runtime_error);
  config = small_locator_config();
  config.max_images = 1;
  EXPECT_THROW(locate_sprite_package(buf, config), runtime_error);
}

TEST(SpritePackageTest, LocateTieBreak) {
  string first = two_image_package(4).build();
  first.resize((first.size() + 3) & ~3, '\0');
  string second = two_image_package(8).build();
  ByteBuffer buf(first + second);

  auto config = small_locator_config();
  config.tie_break = PackageTieBreak::FIRST_MATCH;
  EXPECT_EQ(0, locate_sprite_package(buf, config).base_offset);

  config.tie_break = PackageTieBreak::PREFER_LARGEST_CHARS_OFFSET;
  auto pkg = locate_sprite_package(buf, config);
  EXPECT_EQ(first.size(), pkg.base_offset);
  EXPECT_EQ(8, pkg.palette.size());
}

TEST(SpritePackageTest, TryParseRejectsDanglingImage) {
  auto b = two_image_package();
  b.images[1].sprite_start_index = 4;
  ByteBuffer buf(b.build());
  EXPECT_FALSE(try_parse_sprite_package(buf, 0, small_locator_config()).has_value());
}
