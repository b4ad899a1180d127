#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

namespace ToyBinDASM {

// Bytes needed for w*h pixels at bits_per_pixel, rounded up
size_t packed_pixels_size(size_t w, size_t h, uint8_t bits_per_pixel);

// Reads exactly w*h color indexes, most-significant bit first. If data is too
// short, the missing pixels are 0.
std::vector<uint8_t> unpack_pixels(const void* data, size_t size, size_t w, size_t h, uint8_t bits_per_pixel);
std::vector<uint8_t> unpack_pixels(const std::string& data, size_t w, size_t h, uint8_t bits_per_pixel);

// Inverse of unpack_pixels. Only the low bits_per_pixel bits of each index are
// used; the last byte is padded with zero bits.
std::string pack_pixels(const std::vector<uint8_t>& indexes, uint8_t bits_per_pixel);

} // namespace ToyBinDASM
