#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "ArchiveScanner.hh"
#include "AudioCodecs.hh"
#include "SpritePackage.hh"

namespace ToyBinDASM {

enum class StatTableLayout {
  // Word stream: the first partner has 4 words (stage, unknown1, power,
  // unknown2) and an implicit string index; every other partner has 5 words
  // (string index first)
  D3_WORD_STREAM = 0,
  // Record i holds partner i's string index in word 2; record i+1 holds its
  // power in word 0
  DIGIVICE_SPLIT_RECORDS,
};

struct StatTableConfig {
  StatTableLayout layout;
  size_t base_offset;
  size_t record_size;
  size_t record_count; // For DIGIVICE_SPLIT_RECORDS, the maximum partner count
  uint16_t first_string_index; // D3_WORD_STREAM only
  uint16_t max_power;
};

// Everything that differs between the supported device families. These are
// immutable values; nothing in the library holds a global copy.
struct DeviceProfile {
  std::string name;
  ArchiveScanConfig archive_config;
  // Location keys of the archives that hold partner and NPC names, in the
  // order their strings are numbered
  std::vector<std::string> name_archive_locations;
  std::vector<uint16_t> npc_string_indexes;
  StatTableConfig stats;
  std::string forbidden_chars;
  // Image count window for the sprite package search used by editing flows
  SpritePackageLocatorConfig sprite_locator;
  // Sprite indexes above this are never exported by default
  size_t max_sprite_index;
  // Inclusive range of SPF2ALP block indexes that hold replaceable sounds
  size_t first_sound_block;
  size_t last_sound_block;
  AdpcmConfig adpcm;

  static const DeviceProfile& d3();
  static const DeviceProfile& digivice();
  // Throws invalid_argument for unknown names
  static const DeviceProfile& for_name(const std::string& name);

  bool is_name_archive_location(const std::string& location) const;
};

} // namespace ToyBinDASM
