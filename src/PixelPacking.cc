#include "PixelPacking.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

using namespace std;

namespace ToyBinDASM {

static void check_bits_per_pixel(uint8_t bits_per_pixel) {
  if ((bits_per_pixel < 1) || (bits_per_pixel > 8)) {
    throw invalid_argument(std::format("unsupported pixel depth: {}", bits_per_pixel));
  }
}

size_t packed_pixels_size(size_t w, size_t h, uint8_t bits_per_pixel) {
  return (w * h * bits_per_pixel + 7) / 8;
}

vector<uint8_t> unpack_pixels(const void* data, size_t size, size_t w, size_t h, uint8_t bits_per_pixel) {
  check_bits_per_pixel(bits_per_pixel);

  phosg::StringReader r(data, size);
  phosg::BitReader br = r.subx_bits(0);

  vector<uint8_t> ret(w * h, 0);
  for (size_t z = 0; (z < ret.size()) && !br.eof(); z++) {
    uint8_t v = 0;
    for (uint8_t bit = 0; bit < bits_per_pixel; bit++) {
      v = (v << 1) | (br.eof() ? 0 : br.read(1));
    }
    ret[z] = v;
  }
  return ret;
}

vector<uint8_t> unpack_pixels(const string& data, size_t w, size_t h, uint8_t bits_per_pixel) {
  return unpack_pixels(data.data(), data.size(), w, h, bits_per_pixel);
}

string pack_pixels(const vector<uint8_t>& indexes, uint8_t bits_per_pixel) {
  check_bits_per_pixel(bits_per_pixel);

  phosg::BitWriter w;
  for (uint8_t index : indexes) {
    for (int8_t bit = bits_per_pixel - 1; bit >= 0; bit--) {
      w.write(!!((index >> bit) & 1));
    }
  }
  return w.str();
}

} // namespace ToyBinDASM
