#pragma once

#include <stddef.h>
#include <stdint.h>

#include <optional>
#include <string>
#include <vector>

namespace ToyBinDASM {

// Parses a comma-separated list of palette banks, where each entry is:
//
//  <bank>
//  <min bank>-<max bank>
//
// Banks must be in the range 0-15. The result is sorted and has no
// duplicates.
//
std::vector<uint8_t> parse_cli_banks(const std::string& str);

// Parses a decimal or 0x-prefixed hexadecimal number; the whole string must be
// consumed
size_t parse_cli_number(const std::string& str);

// Names of the files exchanged with image editors:
//
//  <image index>_<subimage index>_<bank>.<ext>
//
// Older tools wrote <image index>_<subimage index>-<bank>.<ext>, which is
// also accepted when parsing.
//
struct SpriteFileName {
  size_t image_index;
  size_t subimage_index;
  uint8_t bank;
};

std::string sprite_file_name_base(size_t image_index, size_t subimage_index, uint8_t bank);
std::optional<SpriteFileName> parse_sprite_file_name(const std::string& filename);

// spf2alp_<index>.wav and chunk_<index>.a18
std::string sound_block_file_name(size_t block_index);
std::string a18_chunk_file_name(size_t chunk_index);

} // namespace ToyBinDASM
