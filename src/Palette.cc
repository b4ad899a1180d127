#include "Palette.hh"

#include <format>
#include <phosg/Image.hh>
#include <stdexcept>

using namespace std;

namespace ToyBinDASM {

AlphaMode parse_alpha_mode(const string& name) {
  if (name == "auto") {
    return AlphaMode::AUTO;
  } else if (name == "normal") {
    return AlphaMode::NORMAL;
  } else if (name == "inverted") {
    return AlphaMode::INVERTED;
  }
  throw invalid_argument(std::format("unknown alpha mode: {}", name));
}

const char* name_for_alpha_mode(AlphaMode mode) {
  switch (mode) {
    case AlphaMode::AUTO:
      return "auto";
    case AlphaMode::NORMAL:
      return "normal";
    case AlphaMode::INVERTED:
      return "inverted";
  }
  throw logic_error("invalid alpha mode");
}

uint32_t decode_argb1555(uint16_t color, AlphaPolarity polarity) {
  uint8_t r = (((color >> 10) & 0x1F) * 0xFF) / 0x1F;
  uint8_t g = (((color >> 5) & 0x1F) * 0xFF) / 0x1F;
  uint8_t b = ((color & 0x1F) * 0xFF) / 0x1F;
  bool alpha_bit = (color & 0x8000);
  bool opaque = (polarity == AlphaPolarity::NORMAL) ? alpha_bit : !alpha_bit;
  return phosg::rgba8888(r, g, b, opaque ? 0xFF : 0x00);
}

uint16_t encode_argb1555(uint32_t rgba8888, AlphaPolarity polarity) {
  uint16_t r = (phosg::get_r(rgba8888) * 0x1F + 0x7F) / 0xFF;
  uint16_t g = (phosg::get_g(rgba8888) * 0x1F + 0x7F) / 0xFF;
  uint16_t b = (phosg::get_b(rgba8888) * 0x1F + 0x7F) / 0xFF;
  bool opaque = (phosg::get_a(rgba8888) >= 0x80);
  bool alpha_bit = (polarity == AlphaPolarity::NORMAL) ? opaque : !opaque;
  return (alpha_bit ? 0x8000 : 0x0000) | (r << 10) | (g << 5) | b;
}

AlphaPolarity guess_alpha_polarity(const vector<uint16_t>& palette, size_t offset, size_t count) {
  if (palette.empty() || (count == 0)) {
    return AlphaPolarity::NORMAL;
  }
  count = min(count, palette.size());
  offset = min(offset, palette.size() - count);

  uint64_t normal_sum = 0;
  uint64_t inverted_sum = 0;
  for (size_t z = offset; z < offset + count; z++) {
    normal_sum += phosg::get_a(decode_argb1555(palette[z], AlphaPolarity::NORMAL));
    inverted_sum += phosg::get_a(decode_argb1555(palette[z], AlphaPolarity::INVERTED));
  }
  return (inverted_sum > normal_sum) ? AlphaPolarity::INVERTED : AlphaPolarity::NORMAL;
}

AlphaPolarity resolve_alpha_polarity(
    AlphaMode mode, const vector<uint16_t>& palette, size_t offset, size_t count) {
  switch (mode) {
    case AlphaMode::NORMAL:
      return AlphaPolarity::NORMAL;
    case AlphaMode::INVERTED:
      return AlphaPolarity::INVERTED;
    case AlphaMode::AUTO:
      return guess_alpha_polarity(palette, offset, count);
  }
  throw logic_error("invalid alpha mode");
}

} // namespace ToyBinDASM
