#pragma once

#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>

#include <optional>
#include <phosg/Image.hh>
#include <string>
#include <vector>

#include "ByteBuffer.hh"
#include "Palette.hh"
#include "PatchApplier.hh"
#include "SpritePackage.hh"

namespace ToyBinDASM {

enum class PaletteStep {
  COLORS = 0, // Each bank advances by the tile's color count
  FOUR, // Each bank advances by 4 colors
};

PaletteStep parse_palette_step(const std::string& name);

struct ComposeOptions {
  AlphaMode alpha_mode = AlphaMode::AUTO;
  PaletteStep palette_step = PaletteStep::COLORS;
  // Use each sprite's own palette bank instead of the bank passed by the
  // caller
  bool use_attribute_bank = false;
};

struct TilePlacement {
  size_t sprite_index;
  SpriteAttributes attrs;
  ssize_t x; // Relative to the subimage's top-left corner
  ssize_t y;
};

struct SubimageLayout {
  size_t width;
  size_t height;
  ssize_t min_x;
  ssize_t min_y;
  std::vector<TilePlacement> tiles;
};

// Returns nullopt if the subimage has no tiles or an empty bounding box
std::optional<SubimageLayout> compute_subimage_layout(
    const SpritePackage& pkg, size_t image_index, size_t subimage_index);

// First palette index used by a tile in the given bank. If the bank's colors
// would run past the end of the palette, the image's base index is used.
size_t palette_slice_offset(const SpritePackage& pkg, const ImageDef& image, const SpriteAttributes& attrs,
    uint8_t bank, PaletteStep step);

// Resolves the alpha mode for an image the same way for composing and
// replacing: by sampling the bank-0 colors of its first tile
AlphaPolarity alpha_polarity_for_subimage(
    const SpritePackage& pkg, size_t image_index, const SubimageLayout& layout, const ComposeOptions& options);

std::optional<phosg::ImageRGBA8888N> compose_subimage(
    const ByteBuffer& buf,
    const SpritePackage& pkg,
    size_t image_index,
    size_t subimage_index,
    uint8_t bank,
    const ComposeOptions& options = ComposeOptions());

// Writes a raster back into the tiles of a subimage. The raster must be
// exactly the composed size; each pixel is mapped to the nearest color in its
// tile's palette slice. Returns the number of tiles written; throws
// invalid_argument if the raster is the wrong size.
size_t replace_subimage(
    PatchApplier& patcher,
    const SpritePackage& pkg,
    size_t image_index,
    size_t subimage_index,
    uint8_t bank,
    const phosg::ImageRGBA8888N& img,
    const ComposeOptions& options = ComposeOptions());

// Builds the palette bank for a subimage from the distinct colors in a
// raster (alpha thresholded at 128), padding with the last color, and writes
// it. If set_sprite_bank is true, the subimage's sprites are also switched to
// that bank. Returns the number of colors written.
size_t update_palette_from_image(
    PatchApplier& patcher,
    const SpritePackage& pkg,
    size_t image_index,
    size_t subimage_index,
    uint8_t bank,
    const phosg::ImageRGBA8888N& img,
    AlphaPolarity polarity,
    bool set_sprite_bank);

uint32_t alpha_blend_over(uint32_t dest, uint32_t src);

// Index of the entry in colors closest to c by summed squared RGBA distance
size_t nearest_color_index(const std::vector<uint32_t>& colors, uint32_t c);

} // namespace ToyBinDASM
