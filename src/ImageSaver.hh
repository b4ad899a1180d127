#pragma once

#include <phosg/Filesystem.hh>
#include <phosg/Image.hh>

#include <cstdio>
#include <string>

namespace ToyBinDASM {

#define IMAGE_SAVER_OPTION "image-format"

// clang-format off
#define IMAGE_SAVER_HELP \
"Image-specific options:\n\
  --" IMAGE_SAVER_OPTION "=png\n\
      Save images as PNG files (default). This is the only format that can be\n\
      read back by replace-sprites and update-palette.\n\
  --" IMAGE_SAVER_OPTION "=bmp\n\
      Save images as Windows bitmaps\n\
  --" IMAGE_SAVER_OPTION "=ppm\n\
      Save images as portable pixmaps (alpha is discarded)\n\
\n"
// clang-format on

class ImageSaver {
public:
  ImageSaver() : image_format(phosg::ImageFormat::PNG) {}

  // Accepts "png", "bmp" or "ppm"; throws invalid_argument otherwise
  void set_format(const std::string& name);

  inline phosg::ImageFormat get_format() const {
    return this->image_format;
  }

  // Returns the filename *with* extension (e.g. for logging)
  template <phosg::PixelFormat Format>
  [[nodiscard]] std::string save_image(const phosg::Image<Format>& img, const std::string& file_name_without_ext) const {
    std::string file_name = file_name_without_ext + "." + phosg::file_extension_for_image_format(this->image_format);
    phosg::save_file(file_name, img.serialize(this->image_format));
    return file_name;
  }

private:
  phosg::ImageFormat image_format;
};

// Decodes a PNG file into RGBA. Throws runtime_error if the data is not a
// readable PNG.
phosg::ImageRGBA8888N decode_png(const std::string& data);
phosg::ImageRGBA8888N load_png(const std::string& filename);

} // namespace ToyBinDASM
