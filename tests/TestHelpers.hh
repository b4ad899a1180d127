#pragma once

#include <stddef.h>
#include <stdint.h>

#include <format>
#include <phosg/Strings.hh>
#include <string>
#include <vector>

#include "ArchiveScanner.hh"
#include "ReplacementTable.hh"

namespace ToyBinDASM {
namespace Test {

inline std::string archive_bytes(const std::vector<ArchiveEntry>& entries, uint16_t magic = 0x3232) {
  phosg::StringWriter w;
  w.put_u16l(magic);
  w.put_u16l(entries.size());
  for (const auto& entry : entries) {
    w.put_u32l(entry.flags);
    w.put_u32l(entry.offset);
    w.put_u32l(entry.compressed_size);
    w.put_u32l(entry.decompressed_size);
  }
  return w.str();
}

inline size_t archive_header_size(size_t entry_count) {
  return sizeof(ArchiveHeader) + entry_count * sizeof(ArchiveEntryHeader);
}

// Strings are laid out back to back after the offset table, each followed by
// its terminator and then extra_zero_words more zero words
inline std::string text_archive_bytes(const std::vector<std::vector<uint16_t>>& strings, size_t extra_zero_words = 0) {
  std::vector<uint16_t> word_offsets;
  size_t word_offset = 1 + strings.size();
  for (const auto& codes : strings) {
    word_offsets.emplace_back(word_offset);
    word_offset += codes.size() + 1 + extra_zero_words;
  }

  phosg::StringWriter w;
  w.put_u16l(strings.size());
  for (uint16_t offset : word_offsets) {
    w.put_u16l(offset);
  }
  for (const auto& codes : strings) {
    for (uint16_t code : codes) {
      w.put_u16l(code);
    }
    for (size_t z = 0; z < extra_zero_words + 1; z++) {
      w.put_u16l(0);
    }
  }
  return w.str();
}

// An archive at offset 0 whose only entry is the given text archive
inline std::string wrapped_text_archive(const std::string& text) {
  size_t header_size = archive_header_size(1);
  std::string ret = archive_bytes({ArchiveEntry{
      0, static_cast<uint32_t>(header_size), static_cast<uint32_t>(text.size()), static_cast<uint32_t>(text.size())}});
  ret += text;
  return ret;
}

// Maps A-Z and _ to their ASCII code points
inline ReplacementTable ascii_letters_table() {
  std::vector<std::pair<std::string, std::string>> rules;
  for (char ch = 'A'; ch <= 'Z'; ch++) {
    rules.emplace_back(std::format("<{:04X}>", static_cast<uint16_t>(ch)), std::string(1, ch));
  }
  rules.emplace_back("<005F>", "_");
  return ReplacementTable(std::move(rules));
}

inline std::vector<uint16_t> ascii_codes(const std::string& s) {
  return std::vector<uint16_t>(s.begin(), s.end());
}

struct TestImageDef {
  uint16_t sprite_start_index;
  uint8_t width;
  uint8_t height;
  uint16_t palette_start_index;
};

struct TestSpriteDef {
  uint16_t char_index;
  int16_t offset_x;
  int16_t offset_y;
  uint16_t attributes;
};

// Lays out a sprite package as header, image defs, sprite defs, palette, then
// character data
struct SpritePackageBuilder {
  std::vector<TestImageDef> images;
  std::vector<TestSpriteDef> sprites;
  std::vector<uint16_t> palette;
  std::string chars;

  size_t image_defs_offset() const {
    return 0x10;
  }
  size_t sprite_defs_offset() const {
    return this->image_defs_offset() + this->images.size() * 6;
  }
  size_t palettes_offset() const {
    return this->sprite_defs_offset() + this->sprites.size() * 8;
  }
  size_t chars_offset() const {
    return this->palettes_offset() + this->palette.size() * 2;
  }

  std::string build() const {
    phosg::StringWriter w;
    w.put_u32l(this->image_defs_offset());
    w.put_u32l(this->sprite_defs_offset());
    w.put_u32l(this->palettes_offset());
    w.put_u32l(this->chars_offset());
    for (const auto& image : this->images) {
      w.put_u16l(image.sprite_start_index);
      w.put_u8(image.width);
      w.put_u8(image.height);
      w.put_u16l(image.palette_start_index);
    }
    for (const auto& sprite : this->sprites) {
      w.put_u16l(sprite.char_index);
      w.put_s16l(sprite.offset_x);
      w.put_s16l(sprite.offset_y);
      w.put_u16l(sprite.attributes);
    }
    for (uint16_t color : this->palette) {
      w.put_u16l(color);
    }
    w.write(this->chars);
    return w.str();
  }
};

// Attribute word for a tile: bits_per_pixel in {2, 4, 6, 8}, size selectors
// 0-3 (8 << selector pixels)
inline uint16_t sprite_attributes(
    uint8_t bits_per_pixel, uint8_t width_selector = 0, uint8_t height_selector = 0, uint8_t bank = 0, uint8_t flip = 0) {
  return ((bits_per_pixel - 2) / 2) | (flip << 2) | (width_selector << 4) | (height_selector << 6) | (bank << 8);
}

} // namespace Test
} // namespace ToyBinDASM
