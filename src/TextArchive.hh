#pragma once

#include <stddef.h>
#include <stdint.h>

#include <optional>
#include <string>
#include <vector>

#include "ArchiveScanner.hh"
#include "ByteBuffer.hh"

namespace ToyBinDASM {

struct TextArchiveConfig {
  size_t max_string_count = 20000;
  // A string must be terminated within this many bytes of its start
  size_t terminator_scan_window = 4096;
};

enum class OverflowPolicy {
  REJECT = 0,
  TRUNCATE,
};

OverflowPolicy parse_overflow_policy(const std::string& name);

// A string table stored in an uncompressed archive entry. The layout is a u16
// string count, then that many u16 word offsets (relative to the start of the
// table), then the strings themselves as null-terminated u16 code sequences.
struct TextArchive {
  std::string location;
  size_t base_offset;
  size_t size;
  std::vector<uint16_t> word_offsets;

  inline size_t string_count() const {
    return this->word_offsets.size();
  }
  // Absolute offset of a string's first code
  inline size_t string_offset(size_t index) const {
    return this->base_offset + this->word_offsets.at(index) * 2;
  }
  // Bytes between this string's offset and the next string's offset (or the
  // end of the table, for the last string)
  size_t string_capacity(size_t index) const;
  // Bytes actually used by the string, including its terminator
  size_t string_occupied_size(const ByteBuffer& buf, size_t index) const;
};

// Returns nullopt (never throws) if the region does not look like a text
// archive. location is stored in the result unmodified.
std::optional<TextArchive> try_parse_text_archive(
    const ByteBuffer& buf,
    size_t offset,
    size_t size,
    const std::string& location = "",
    const TextArchiveConfig& config = TextArchiveConfig());

// Classifies the entries of a located archive. Only uncompressed entries are
// candidates; the view extends for the entry's data size, clipped to the end
// of the buffer.
std::vector<TextArchive> find_text_archives(
    const ByteBuffer& buf,
    const LocatedArchive& archive,
    const TextArchiveConfig& config = TextArchiveConfig());

// Raw codes of one string, without the terminator. Control codes are dropped.
std::vector<uint16_t> decode_string_codes(const ByteBuffer& buf, const TextArchive& archive, size_t index);

// Serializes codes as little-endian words followed by a zero terminator
std::string encode_string_codes(const std::vector<uint16_t>& codes);

// Encodes codes for a slot of the given capacity. If the encoding doesn't fit,
// REJECT returns nullopt and TRUNCATE drops codes from the end until it does.
std::optional<std::string> encode_for_slot(
    const std::vector<uint16_t>& codes, size_t capacity, OverflowPolicy policy);

} // namespace ToyBinDASM
