#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

namespace ToyBinDASM {

// How bit 15 of a packed color is interpreted
enum class AlphaPolarity {
  NORMAL = 0, // Bit 15 set means opaque
  INVERTED, // Bit 15 clear means opaque
};

enum class AlphaMode {
  AUTO = 0,
  NORMAL,
  INVERTED,
};

AlphaMode parse_alpha_mode(const std::string& name);
const char* name_for_alpha_mode(AlphaMode mode);

// Color format is ARGB1555 (XRRRRRGGGGGBBBBB, X = alpha bit); results are
// RGBA8888 as used by phosg::Image
uint32_t decode_argb1555(uint16_t color, AlphaPolarity polarity);
uint16_t encode_argb1555(uint32_t rgba8888, AlphaPolarity polarity);

// Picks the interpretation under which count colors starting at offset are
// more opaque in total. If the range runs past the end of the palette, it is
// moved back so that it ends at the end of the palette. Ties go to NORMAL.
AlphaPolarity guess_alpha_polarity(const std::vector<uint16_t>& palette, size_t offset, size_t count);

AlphaPolarity resolve_alpha_polarity(
    AlphaMode mode, const std::vector<uint16_t>& palette, size_t offset, size_t count);

} // namespace ToyBinDASM
