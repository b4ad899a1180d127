#include "SpritePackage.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "PixelPacking.hh"

using namespace std;

namespace ToyBinDASM {

SpriteAttributes::SpriteAttributes(uint16_t attributes)
    : color_selector(attributes & 3),
      flip((attributes >> 2) & 3),
      width_selector((attributes >> 4) & 3),
      height_selector((attributes >> 6) & 3),
      palette_bank((attributes >> 8) & 0x0F),
      depth((attributes >> 12) & 3),
      blend((attributes >> 14) & 1),
      extra((attributes >> 15) & 1) {}

size_t SpriteAttributes::char_data_size() const {
  return packed_pixels_size(this->width(), this->height(), this->bits_per_pixel());
}

uint16_t replace_palette_bank(uint16_t attributes, uint8_t bank) {
  if (bank > 0x0F) {
    throw invalid_argument(std::format("palette bank {} is out of range (0..15)", bank));
  }
  return (attributes & 0xF0FF) | (bank << 8);
}

size_t SpritePackage::subimage_count(size_t image_index) const {
  const auto& image = this->images.at(image_index);
  size_t per_subimage = image.sprites_per_subimage();
  if (per_subimage == 0) {
    return 0;
  }
  int64_t end_index = (image_index + 1 < this->images.size())
      ? static_cast<int64_t>(this->images[image_index + 1].sprite_start_index)
      : static_cast<int64_t>(this->sprites.size());
  int64_t total = end_index - static_cast<int64_t>(image.sprite_start_index);
  return (total > static_cast<int64_t>(per_subimage)) ? (total / per_subimage) : 1;
}

size_t SpritePackage::first_sprite_index(size_t image_index, size_t subimage_index) const {
  const auto& image = this->images.at(image_index);
  return image.sprite_start_index + subimage_index * image.sprites_per_subimage();
}

size_t SpritePackage::sprite_count(size_t image_index, size_t subimage_index) const {
  size_t start = this->first_sprite_index(image_index, subimage_index);
  if (start >= this->sprites.size()) {
    return 0;
  }
  return min(this->images[image_index].sprites_per_subimage(), this->sprites.size() - start);
}

size_t SpritePackage::char_data_offset(const SpriteDef& sprite) const {
  SpriteAttributes attrs(sprite.attributes);
  return this->base_offset + this->chars_offset + sprite.char_index * attrs.char_data_size();
}

size_t SpritePackage::palette_entry_offset(size_t color_index) const {
  if (color_index >= this->palette.size()) {
    throw out_of_range(std::format("palette index {} is out of range", color_index));
  }
  return this->base_offset + this->palettes_offset + color_index * 2;
}

size_t SpritePackage::sprite_attributes_offset(size_t sprite_index) const {
  if (sprite_index >= this->sprites.size()) {
    throw out_of_range(std::format("sprite index {} is out of range", sprite_index));
  }
  return this->base_offset + this->sprite_defs_offset + sprite_index * sizeof(SpriteDef) + 6; // SpriteDef::attributes
}

set<uint8_t> SpritePackage::collect_bank_usage(uint16_t palette_start_index) const {
  set<uint8_t> ret;
  for (size_t image_index = 0; image_index < this->images.size(); image_index++) {
    if (this->images[image_index].palette_start_index != palette_start_index) {
      continue;
    }
    size_t num_subimages = this->subimage_count(image_index);
    for (size_t sub = 0; sub < num_subimages; sub++) {
      size_t start = this->first_sprite_index(image_index, sub);
      size_t count = this->sprite_count(image_index, sub);
      for (size_t z = start; z < start + count; z++) {
        ret.emplace(SpriteAttributes(this->sprites[z].attributes).palette_bank);
      }
    }
    if (ret.size() >= 8) {
      ret.clear();
      for (uint8_t bank = 0; bank < 16; bank++) {
        ret.emplace(bank);
      }
      return ret;
    }
  }
  return ret;
}

uint8_t SpritePackage::choose_free_bank(uint16_t palette_start_index) const {
  auto used = this->collect_bank_usage(palette_start_index);
  for (uint8_t bank = 0; bank < 16; bank++) {
    if (!used.count(bank)) {
      return bank;
    }
  }
  return 15;
}

static bool header_is_plausible(const SpritePackageHeader& header, size_t available_bytes) {
  if (!((0 < header.image_defs_offset) &&
          (header.image_defs_offset < header.sprite_defs_offset) &&
          (header.sprite_defs_offset < header.palettes_offset) &&
          (header.palettes_offset < header.chars_offset) &&
          (header.chars_offset <= available_bytes))) {
    return false;
  }
  return ((header.sprite_defs_offset - header.image_defs_offset) % sizeof(ImageDef) == 0) &&
      ((header.palettes_offset - header.sprite_defs_offset) % sizeof(SpriteDef) == 0) &&
      ((header.chars_offset - header.palettes_offset) % 2 == 0);
}

static SpritePackage parse_sprite_package_tables(
    const ByteBuffer& buf, size_t offset, const SpritePackageHeader& header) {
  auto r = buf.view(offset, buf.size() - offset);

  SpritePackage ret;
  ret.base_offset = offset;
  ret.image_defs_offset = header.image_defs_offset;
  ret.sprite_defs_offset = header.sprite_defs_offset;
  ret.palettes_offset = header.palettes_offset;
  ret.chars_offset = header.chars_offset;

  size_t num_images = (ret.sprite_defs_offset - ret.image_defs_offset) / sizeof(ImageDef);
  size_t num_sprites = (ret.palettes_offset - ret.sprite_defs_offset) / sizeof(SpriteDef);
  size_t num_colors = (ret.chars_offset - ret.palettes_offset) / 2;

  r.go(ret.image_defs_offset);
  ret.images.reserve(num_images);
  for (size_t z = 0; z < num_images; z++) {
    ret.images.emplace_back(r.get<ImageDef>());
  }
  r.go(ret.sprite_defs_offset);
  ret.sprites.reserve(num_sprites);
  for (size_t z = 0; z < num_sprites; z++) {
    ret.sprites.emplace_back(r.get<SpriteDef>());
  }
  r.go(ret.palettes_offset);
  ret.palette.reserve(num_colors);
  for (size_t z = 0; z < num_colors; z++) {
    ret.palette.emplace_back(r.get_u16l());
  }
  return ret;
}

optional<SpritePackage> try_parse_sprite_package(
    const ByteBuffer& buf, size_t offset, const SpritePackageLocatorConfig& config) {
  if (!buf.contains(offset, sizeof(SpritePackageHeader))) {
    return nullopt;
  }
  auto r = buf.reader();
  const auto& header = r.pget<SpritePackageHeader>(offset);
  if (!header_is_plausible(header, buf.size() - offset)) {
    return nullopt;
  }

  size_t num_images = (header.sprite_defs_offset - header.image_defs_offset) / sizeof(ImageDef);
  size_t num_sprites = (header.palettes_offset - header.sprite_defs_offset) / sizeof(SpriteDef);
  size_t num_colors = (header.chars_offset - header.palettes_offset) / 2;
  if ((num_images < config.min_images) || (num_images > config.max_images) || (num_colors < config.min_colors)) {
    return nullopt;
  }
  const auto& last_image = r.pget<ImageDef>(offset + header.image_defs_offset + (num_images - 1) * sizeof(ImageDef));
  if (last_image.sprite_start_index >= num_sprites) {
    return nullopt;
  }

  return parse_sprite_package_tables(buf, offset, header);
}

SpritePackage parse_sprite_package(const ByteBuffer& buf, size_t offset) {
  if (!buf.contains(offset, sizeof(SpritePackageHeader))) {
    throw out_of_range(std::format("sprite package offset 0x{:X} is beyond end of buffer", offset));
  }
  const auto& header = buf.reader().pget<SpritePackageHeader>(offset);
  if (!header_is_plausible(header, buf.size() - offset)) {
    throw runtime_error(std::format("data at 0x{:X} is not a sprite package", offset));
  }
  return parse_sprite_package_tables(buf, offset, header);
}

SpritePackage locate_sprite_package(
    const ByteBuffer& buf, const SpritePackageLocatorConfig& config, const ScanControl* control) {
  optional<SpritePackage> best;
  size_t end_offset = (buf.size() > sizeof(SpritePackageHeader)) ? (buf.size() - sizeof(SpritePackageHeader)) : 0;
  for (size_t offset = 0; offset < end_offset; offset += config.scan_alignment) {
    if (control) {
      control->step(offset, end_offset);
    }
    auto candidate = try_parse_sprite_package(buf, offset, config);
    if (!candidate) {
      continue;
    }
    if (config.tie_break == PackageTieBreak::FIRST_MATCH) {
      best = std::move(candidate);
      break;
    }
    if (!best || (candidate->chars_offset > best->chars_offset)) {
      best = std::move(candidate);
    }
  }

  if (!best) {
    throw runtime_error("no sprite package found");
  }
  phosg::log_info_f("Sprite package found at 0x{:X} ({} images, {} sprites, {} colors)",
      best->base_offset, best->images.size(), best->sprites.size(), best->palette.size());
  return std::move(*best);
}

} // namespace ToyBinDASM
