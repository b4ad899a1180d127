#include "SpriteCompositor.hh"

#include <algorithm>
#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "PixelPacking.hh"

using namespace std;

namespace ToyBinDASM {

PaletteStep parse_palette_step(const string& name) {
  if (name == "colors") {
    return PaletteStep::COLORS;
  } else if (name == "4") {
    return PaletteStep::FOUR;
  }
  throw invalid_argument(std::format("unknown palette step: {}", name));
}

optional<SubimageLayout> compute_subimage_layout(const SpritePackage& pkg, size_t image_index, size_t subimage_index) {
  size_t start = pkg.first_sprite_index(image_index, subimage_index);
  size_t count = pkg.sprite_count(image_index, subimage_index);
  if (count == 0) {
    return nullopt;
  }

  ssize_t min_x = 0, min_y = 0, max_x = 0, max_y = 0;
  for (size_t z = start; z < start + count; z++) {
    const auto& sprite = pkg.sprites[z];
    SpriteAttributes attrs(sprite.attributes);
    ssize_t x1 = sprite.offset_x;
    ssize_t y1 = sprite.offset_y;
    ssize_t x2 = x1 + attrs.width();
    ssize_t y2 = y1 + attrs.height();
    if (z == start) {
      min_x = x1;
      min_y = y1;
      max_x = x2;
      max_y = y2;
    } else {
      min_x = min(min_x, x1);
      min_y = min(min_y, y1);
      max_x = max(max_x, x2);
      max_y = max(max_y, y2);
    }
  }
  if ((max_x <= min_x) || (max_y <= min_y)) {
    return nullopt;
  }

  SubimageLayout ret;
  ret.width = max_x - min_x;
  ret.height = max_y - min_y;
  ret.min_x = min_x;
  ret.min_y = min_y;
  for (size_t z = start; z < start + count; z++) {
    const auto& sprite = pkg.sprites[z];
    ret.tiles.emplace_back(TilePlacement{
        z, SpriteAttributes(sprite.attributes), sprite.offset_x - min_x, sprite.offset_y - min_y});
  }
  return ret;
}

size_t palette_slice_offset(
    const SpritePackage& pkg, const ImageDef& image, const SpriteAttributes& attrs, uint8_t bank, PaletteStep step) {
  size_t colors = attrs.color_count();
  size_t bank_step = (step == PaletteStep::COLORS) ? colors : 4;
  size_t base = image.palette_base();
  size_t offset = base + bank * bank_step;
  return (offset + colors > pkg.palette.size()) ? base : offset;
}

AlphaPolarity alpha_polarity_for_subimage(
    const SpritePackage& pkg, size_t image_index, const SubimageLayout& layout, const ComposeOptions& options) {
  const auto& image = pkg.images.at(image_index);
  return resolve_alpha_polarity(
      options.alpha_mode, pkg.palette, image.palette_base(), layout.tiles.at(0).attrs.color_count());
}

uint32_t alpha_blend_over(uint32_t dest, uint32_t src) {
  uint32_t src_a = phosg::get_a(src);
  uint32_t dest_a = phosg::get_a(dest);
  // An empty destination takes the source as-is, so transparent palette
  // entries keep their color
  if ((src_a == 0xFF) || (dest_a == 0)) {
    return src;
  }
  if (src_a == 0) {
    return dest;
  }
  uint32_t dest_weight = (dest_a * (0xFF - src_a)) / 0xFF;
  uint32_t out_a = src_a + dest_weight;
  if (out_a == 0) {
    return 0;
  }
  auto blend = [&](uint32_t s, uint32_t d) -> uint8_t {
    return (s * src_a + d * dest_weight) / out_a;
  };
  return phosg::rgba8888(
      blend(phosg::get_r(src), phosg::get_r(dest)),
      blend(phosg::get_g(src), phosg::get_g(dest)),
      blend(phosg::get_b(src), phosg::get_b(dest)),
      out_a);
}

size_t nearest_color_index(const vector<uint32_t>& colors, uint32_t c) {
  if (colors.empty()) {
    throw invalid_argument("cannot match color against empty palette");
  }
  size_t best_index = 0;
  uint64_t best_distance = UINT64_MAX;
  for (size_t z = 0; (z < colors.size()) && (best_distance != 0); z++) {
    int64_t dr = static_cast<int64_t>(phosg::get_r(c)) - phosg::get_r(colors[z]);
    int64_t dg = static_cast<int64_t>(phosg::get_g(c)) - phosg::get_g(colors[z]);
    int64_t db = static_cast<int64_t>(phosg::get_b(c)) - phosg::get_b(colors[z]);
    int64_t da = static_cast<int64_t>(phosg::get_a(c)) - phosg::get_a(colors[z]);
    uint64_t distance = dr * dr + dg * dg + db * db + da * da;
    if (distance < best_distance) {
      best_distance = distance;
      best_index = z;
    }
  }
  return best_index;
}

static vector<uint8_t> read_tile_pixels(const ByteBuffer& buf, const SpritePackage& pkg, const SpriteDef& sprite) {
  SpriteAttributes attrs(sprite.attributes);
  size_t offset = pkg.char_data_offset(sprite);
  size_t size = attrs.char_data_size();
  // Tiles at the very end of the buffer are decoded as far as the data goes
  size_t available = (offset < buf.size()) ? min(size, buf.size() - offset) : 0;
  return unpack_pixels(
      buf.contents().data() + min(offset, buf.size()), available, attrs.width(), attrs.height(), attrs.bits_per_pixel());
}

optional<phosg::ImageRGBA8888N> compose_subimage(
    const ByteBuffer& buf,
    const SpritePackage& pkg,
    size_t image_index,
    size_t subimage_index,
    uint8_t bank,
    const ComposeOptions& options) {
  auto layout = compute_subimage_layout(pkg, image_index, subimage_index);
  if (!layout) {
    return nullopt;
  }
  const auto& image = pkg.images[image_index];
  AlphaPolarity polarity = alpha_polarity_for_subimage(pkg, image_index, *layout, options);

  phosg::ImageRGBA8888N ret(layout->width, layout->height);
  ret.clear(0x00000000);
  for (const auto& tile : layout->tiles) {
    const auto& sprite = pkg.sprites[tile.sprite_index];
    uint8_t tile_bank = options.use_attribute_bank ? tile.attrs.palette_bank : bank;
    size_t slice = palette_slice_offset(pkg, image, tile.attrs, tile_bank, options.palette_step);
    auto pixels = read_tile_pixels(buf, pkg, sprite);

    size_t w = tile.attrs.width();
    size_t h = tile.attrs.height();
    for (size_t y = 0; y < h; y++) {
      for (size_t x = 0; x < w; x++) {
        size_t color_index = slice + pixels[y * w + x];
        uint32_t color = (color_index < pkg.palette.size())
            ? decode_argb1555(pkg.palette[color_index], polarity)
            : 0x00000000;
        size_t dest_x = tile.x + (tile.attrs.flip_h() ? (w - 1 - x) : x);
        size_t dest_y = tile.y + (tile.attrs.flip_v() ? (h - 1 - y) : y);
        ret.write(dest_x, dest_y, alpha_blend_over(ret.read(dest_x, dest_y), color));
      }
    }
  }
  return ret;
}

size_t replace_subimage(
    PatchApplier& patcher,
    const SpritePackage& pkg,
    size_t image_index,
    size_t subimage_index,
    uint8_t bank,
    const phosg::ImageRGBA8888N& img,
    const ComposeOptions& options) {
  auto layout = compute_subimage_layout(pkg, image_index, subimage_index);
  if (!layout) {
    throw invalid_argument(std::format("image {} subimage {} has no tiles", image_index, subimage_index));
  }
  if ((img.get_width() != layout->width) || (img.get_height() != layout->height)) {
    throw invalid_argument(std::format("image is {}x{}, but subimage is {}x{}",
        img.get_width(), img.get_height(), layout->width, layout->height));
  }
  const auto& image = pkg.images[image_index];
  AlphaPolarity polarity = alpha_polarity_for_subimage(pkg, image_index, *layout, options);

  size_t num_written = 0;
  for (const auto& tile : layout->tiles) {
    const auto& sprite = pkg.sprites[tile.sprite_index];
    uint8_t tile_bank = options.use_attribute_bank ? tile.attrs.palette_bank : bank;
    size_t slice = palette_slice_offset(pkg, image, tile.attrs, tile_bank, options.palette_step);

    vector<uint32_t> colors;
    for (size_t z = slice; (z < slice + tile.attrs.color_count()) && (z < pkg.palette.size()); z++) {
      colors.emplace_back(decode_argb1555(pkg.palette[z], polarity));
    }
    if (colors.empty()) {
      phosg::log_warning_f("Sprite {} has no palette colors in bank {}; skipping it", tile.sprite_index, tile_bank);
      continue;
    }

    size_t w = tile.attrs.width();
    size_t h = tile.attrs.height();
    vector<uint8_t> indexes(w * h);
    for (size_t y = 0; y < h; y++) {
      for (size_t x = 0; x < w; x++) {
        size_t src_x = tile.x + (tile.attrs.flip_h() ? (w - 1 - x) : x);
        size_t src_y = tile.y + (tile.attrs.flip_v() ? (h - 1 - y) : y);
        indexes[y * w + x] = nearest_color_index(colors, img.read(src_x, src_y));
      }
    }

    string packed = pack_pixels(indexes, tile.attrs.bits_per_pixel());
    auto res = patcher.apply_exact(pkg.char_data_offset(sprite), packed, tile.attrs.char_data_size());
    if (patch_succeeded(res)) {
      num_written++;
    } else {
      phosg::log_warning_f("Sprite {} could not be written: {}", tile.sprite_index, name_for_patch_result(res));
    }
  }
  return num_written;
}

size_t update_palette_from_image(
    PatchApplier& patcher,
    const SpritePackage& pkg,
    size_t image_index,
    size_t subimage_index,
    uint8_t bank,
    const phosg::ImageRGBA8888N& img,
    AlphaPolarity polarity,
    bool set_sprite_bank) {
  auto layout = compute_subimage_layout(pkg, image_index, subimage_index);
  if (!layout) {
    throw invalid_argument(std::format("image {} subimage {} has no tiles", image_index, subimage_index));
  }
  if (bank > 0x0F) {
    throw invalid_argument(std::format("palette bank {} is out of range (0..15)", bank));
  }
  const auto& image = pkg.images[image_index];
  size_t num_colors = layout->tiles[0].attrs.color_count();
  size_t bank_offset = image.palette_base() + bank * num_colors;
  if (bank_offset + num_colors > pkg.palette.size()) {
    throw out_of_range(std::format("palette bank {} of image {} extends beyond the end of the palette", bank, image_index));
  }

  vector<uint32_t> colors;
  for (size_t y = 0; (y < img.get_height()) && (colors.size() < num_colors); y++) {
    for (size_t x = 0; (x < img.get_width()) && (colors.size() < num_colors); x++) {
      uint32_t c = img.read(x, y);
      uint32_t key = phosg::rgba8888(phosg::get_r(c), phosg::get_g(c), phosg::get_b(c), (phosg::get_a(c) >= 0x80) ? 0xFF : 0x00);
      if (find(colors.begin(), colors.end(), key) == colors.end()) {
        colors.emplace_back(key);
      }
    }
  }
  if (colors.empty()) {
    colors.emplace_back(0x00000000);
  }
  while (colors.size() < num_colors) {
    colors.emplace_back(colors.back());
  }

  phosg::StringWriter w;
  for (uint32_t c : colors) {
    w.put_u16l(encode_argb1555(c, polarity));
  }
  auto res = patcher.apply_exact(pkg.palette_entry_offset(bank_offset), w.str(), num_colors * 2);
  if (!patch_succeeded(res)) {
    throw runtime_error(std::format("palette bank {} could not be written: {}", bank, name_for_patch_result(res)));
  }

  if (set_sprite_bank) {
    for (const auto& tile : layout->tiles) {
      uint16_t attributes = pkg.sprites[tile.sprite_index].attributes;
      auto attr_res = patcher.apply_u16l(pkg.sprite_attributes_offset(tile.sprite_index), replace_palette_bank(attributes, bank));
      if (!patch_succeeded(attr_res)) {
        throw runtime_error(std::format("attributes of sprite {} could not be written: {}",
            tile.sprite_index, name_for_patch_result(attr_res)));
      }
    }
  }
  return num_colors;
}

} // namespace ToyBinDASM
