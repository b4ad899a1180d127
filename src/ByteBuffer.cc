#include "ByteBuffer.hh"

#include <string.h>

#include <filesystem>
#include <format>
#include <phosg/Encoding.hh>
#include <phosg/Filesystem.hh>
#include <stdexcept>

using namespace std;

namespace ToyBinDASM {

ByteBuffer::ByteBuffer(string&& data) : data(std::move(data)) {}

ByteBuffer::ByteBuffer(const string& data) : data(data) {}

ByteBuffer ByteBuffer::load(const string& filename) {
  return ByteBuffer(phosg::load_file(filename));
}

void ByteBuffer::save(const string& filename) const {
  string temp_filename = filename + ".tmp";
  phosg::save_file(temp_filename, this->data);
  std::filesystem::rename(temp_filename, filename);
}

void ByteBuffer::check_range(size_t offset, size_t size) const {
  if (!this->contains(offset, size)) {
    throw out_of_range(std::format(
        "access of {} bytes at 0x{:X} is beyond end of buffer (0x{:X} bytes)",
        size, offset, this->data.size()));
  }
}

uint8_t ByteBuffer::u8(size_t offset) const {
  this->check_range(offset, 1);
  return static_cast<uint8_t>(this->data[offset]);
}

uint16_t ByteBuffer::u16l(size_t offset) const {
  this->check_range(offset, 2);
  return this->reader().pget_u16l(offset);
}

int16_t ByteBuffer::s16l(size_t offset) const {
  this->check_range(offset, 2);
  return this->reader().pget_s16l(offset);
}

uint32_t ByteBuffer::u32l(size_t offset) const {
  this->check_range(offset, 4);
  return this->reader().pget_u32l(offset);
}

string ByteBuffer::read(size_t offset, size_t size) const {
  this->check_range(offset, size);
  return this->data.substr(offset, size);
}

phosg::StringReader ByteBuffer::reader() const {
  return phosg::StringReader(this->data.data(), this->data.size());
}

phosg::StringReader ByteBuffer::view(size_t offset, size_t size) const {
  this->check_range(offset, size);
  return phosg::StringReader(this->data.data() + offset, size);
}

void ByteBuffer::put_u8(size_t offset, uint8_t v) {
  this->check_range(offset, 1);
  this->data[offset] = static_cast<char>(v);
}

void ByteBuffer::put_u16l(size_t offset, uint16_t v) {
  phosg::le_uint16_t le_v = v;
  this->write(offset, &le_v, sizeof(le_v));
}

void ByteBuffer::write(size_t offset, const void* data, size_t size) {
  this->check_range(offset, size);
  memcpy(this->data.data() + offset, data, size);
}

void ByteBuffer::write(size_t offset, const string& data) {
  this->write(offset, data.data(), data.size());
}

size_t ByteBuffer::find(const string& needle, size_t start) const {
  return this->data.find(needle, start);
}

} // namespace ToyBinDASM
