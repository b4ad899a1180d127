#include "ImageSaver.hh"

#include <png.h>
#include <string.h>

#include <format>
#include <stdexcept>
#include <vector>

using namespace std;

namespace ToyBinDASM {

void ImageSaver::set_format(const string& name) {
  if (name == "png") {
    this->image_format = phosg::ImageFormat::PNG;
  } else if (name == "bmp") {
    this->image_format = phosg::ImageFormat::WINDOWS_BITMAP;
  } else if (name == "ppm") {
    this->image_format = phosg::ImageFormat::COLOR_PPM;
  } else {
    throw invalid_argument(std::format("unknown image format: {}", name));
  }
}

phosg::ImageRGBA8888N decode_png(const string& data) {
  png_image image;
  memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;

  if (!png_image_begin_read_from_memory(&image, data.data(), data.size())) {
    string message = image.message;
    png_image_free(&image);
    throw runtime_error(std::format("cannot read PNG header: {}", message));
  }

  image.format = PNG_FORMAT_RGBA;
  vector<uint8_t> pixels(PNG_IMAGE_SIZE(image));
  if (!png_image_finish_read(&image, nullptr, pixels.data(), 0, nullptr)) {
    string message = image.message;
    png_image_free(&image);
    throw runtime_error(std::format("cannot decode PNG: {}", message));
  }

  phosg::ImageRGBA8888N ret(image.width, image.height);
  const uint8_t* p = pixels.data();
  for (size_t y = 0; y < image.height; y++) {
    for (size_t x = 0; x < image.width; x++, p += 4) {
      ret.write(x, y, phosg::rgba8888(p[0], p[1], p[2], p[3]));
    }
  }
  return ret;
}

phosg::ImageRGBA8888N load_png(const string& filename) {
  return decode_png(phosg::load_file(filename));
}

} // namespace ToyBinDASM
