#pragma once

#include <stddef.h>
#include <stdint.h>

#include <phosg/Strings.hh>
#include <string>

namespace ToyBinDASM {

// The complete contents of a ROM image. Every format view in this project is
// an offset into one of these; mutation is only possible through put/write,
// which overwrite bytes in place and can never change the length.
class ByteBuffer {
public:
  ByteBuffer() = default;
  explicit ByteBuffer(std::string&& data);
  explicit ByteBuffer(const std::string& data);
  ByteBuffer(const ByteBuffer&) = delete;
  ByteBuffer(ByteBuffer&&) = default;
  ByteBuffer& operator=(const ByteBuffer&) = delete;
  ByteBuffer& operator=(ByteBuffer&&) = default;
  ~ByteBuffer() = default;

  static ByteBuffer load(const std::string& filename);
  // Writes the whole buffer to a temporary file next to filename, then renames
  // it into place
  void save(const std::string& filename) const;

  inline size_t size() const {
    return this->data.size();
  }
  inline const std::string& contents() const {
    return this->data;
  }
  inline bool contains(size_t offset, size_t size) const {
    return (offset <= this->data.size()) && (size <= this->data.size() - offset);
  }

  // All of these throw out_of_range if the access is not entirely within the
  // buffer
  uint8_t u8(size_t offset) const;
  uint16_t u16l(size_t offset) const;
  int16_t s16l(size_t offset) const;
  uint32_t u32l(size_t offset) const;
  std::string read(size_t offset, size_t size) const;
  phosg::StringReader reader() const;
  phosg::StringReader view(size_t offset, size_t size) const;

  void put_u8(size_t offset, uint8_t v);
  void put_u16l(size_t offset, uint16_t v);
  void write(size_t offset, const void* data, size_t size);
  void write(size_t offset, const std::string& data);

  // Returns the offset of the first occurrence of needle at or after start,
  // or std::string::npos
  size_t find(const std::string& needle, size_t start = 0) const;

private:
  void check_range(size_t offset, size_t size) const;

  std::string data;
};

} // namespace ToyBinDASM
