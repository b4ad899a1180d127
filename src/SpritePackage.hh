#pragma once

#include <stddef.h>
#include <stdint.h>

#include <optional>
#include <phosg/Encoding.hh>
#include <set>
#include <string>
#include <vector>

#include "ByteBuffer.hh"
#include "ScanControl.hh"

namespace ToyBinDASM {

// All offsets are relative to the start of this header
struct SpritePackageHeader {
  phosg::le_uint32_t image_defs_offset;
  phosg::le_uint32_t sprite_defs_offset;
  phosg::le_uint32_t palettes_offset;
  phosg::le_uint32_t chars_offset;
} __attribute__((packed));

struct ImageDef {
  phosg::le_uint16_t sprite_start_index;
  uint8_t width; // In tiles
  uint8_t height; // In tiles
  // Index into the palette in units of 4 colors
  phosg::le_uint16_t palette_start_index;

  inline size_t sprites_per_subimage() const {
    return this->width * this->height;
  }
  inline size_t palette_base() const {
    return this->palette_start_index * 4;
  }
} __attribute__((packed));

struct SpriteDef {
  phosg::le_uint16_t char_index;
  phosg::le_int16_t offset_x;
  phosg::le_int16_t offset_y;
  phosg::le_uint16_t attributes;
} __attribute__((packed));

// Bit layout of SpriteDef::attributes:
//   EBBDPPPP VVHHFFCC
//   C = color depth selector (bits per pixel = C * 2 + 2)
//   F = flip flags (1 = horizontal, 2 = vertical)
//   H = width selector (8 << H pixels)
//   V = height selector (8 << V pixels)
//   P = palette bank
//   D = depth (unused here)
//   B = blend (unused here)
//   E = extra (unused here)
struct SpriteAttributes {
  uint8_t color_selector;
  uint8_t flip;
  uint8_t width_selector;
  uint8_t height_selector;
  uint8_t palette_bank;
  uint8_t depth;
  bool blend;
  bool extra;

  explicit SpriteAttributes(uint16_t attributes);

  inline bool flip_h() const {
    return this->flip & 1;
  }
  inline bool flip_v() const {
    return this->flip & 2;
  }
  inline uint8_t bits_per_pixel() const {
    return this->color_selector * 2 + 2;
  }
  inline size_t color_count() const {
    return 1 << this->bits_per_pixel();
  }
  inline size_t width() const {
    return 8 << this->width_selector;
  }
  inline size_t height() const {
    return 8 << this->height_selector;
  }
  size_t char_data_size() const;
};

uint16_t replace_palette_bank(uint16_t attributes, uint8_t bank);

enum class PackageTieBreak {
  PREFER_LARGEST_CHARS_OFFSET = 0,
  FIRST_MATCH,
};

struct SpritePackageLocatorConfig {
  size_t min_images = 1000;
  size_t max_images = 5000;
  size_t min_colors = 64;
  size_t scan_alignment = 4;
  PackageTieBreak tie_break = PackageTieBreak::PREFER_LARGEST_CHARS_OFFSET;
};

struct SpritePackage {
  size_t base_offset;
  uint32_t image_defs_offset;
  uint32_t sprite_defs_offset;
  uint32_t palettes_offset;
  uint32_t chars_offset;
  std::vector<ImageDef> images;
  std::vector<SpriteDef> sprites;
  std::vector<uint16_t> palette;

  size_t subimage_count(size_t image_index) const;
  // Index of the first sprite of a subimage
  size_t first_sprite_index(size_t image_index, size_t subimage_index) const;
  // Number of sprites actually present for a subimage (may be less than
  // width * height if the table ends early)
  size_t sprite_count(size_t image_index, size_t subimage_index) const;

  // Absolute offsets within the containing buffer
  size_t char_data_offset(const SpriteDef& sprite) const;
  size_t palette_entry_offset(size_t color_index) const;
  size_t sprite_attributes_offset(size_t sprite_index) const;

  // Banks referenced by the sprites of every image that shares
  // palette_start_index. Returns all 16 banks once 8 are in use.
  std::set<uint8_t> collect_bank_usage(uint16_t palette_start_index) const;
  // The lowest bank not used by any image sharing the palette, or 15
  uint8_t choose_free_bank(uint16_t palette_start_index) const;
};

// Returns nullopt (never throws) if the data at offset does not pass all the
// structural checks
std::optional<SpritePackage> try_parse_sprite_package(
    const ByteBuffer& buf, size_t offset, const SpritePackageLocatorConfig& config);

// Parses the package at offset without heuristic count limits. Throws if the
// header is structurally invalid.
SpritePackage parse_sprite_package(const ByteBuffer& buf, size_t offset);

// Scans the buffer for the sprite package. Throws runtime_error if none is
// found.
SpritePackage locate_sprite_package(
    const ByteBuffer& buf,
    const SpritePackageLocatorConfig& config = SpritePackageLocatorConfig(),
    const ScanControl* control = nullptr);

} // namespace ToyBinDASM
