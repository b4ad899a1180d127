#pragma once

#include <stddef.h>
#include <stdint.h>

#include <deque>
#include <optional>
#include <phosg/Encoding.hh>
#include <string>
#include <utility>
#include <vector>

#include "ByteBuffer.hh"
#include "ScanControl.hh"

namespace ToyBinDASM {

struct ArchiveHeader {
  phosg::le_uint16_t magic;
  phosg::le_uint16_t entry_count;
  // ArchiveEntryHeader entries[entry_count];
} __attribute__((packed));

struct ArchiveEntryHeader {
  phosg::le_uint32_t flags;
  phosg::le_uint32_t offset; // Relative to the archive header
  phosg::le_uint32_t compressed_size;
  phosg::le_uint32_t decompressed_size;
} __attribute__((packed));

struct ArchiveEntry {
  uint32_t flags;
  uint32_t offset;
  uint32_t compressed_size;
  uint32_t decompressed_size;

  inline bool is_compressed() const {
    return (this->flags & 0x0F) != 0;
  }
  // decompressed_size if set, otherwise compressed_size
  inline uint32_t data_size() const {
    return this->decompressed_size ? this->decompressed_size : this->compressed_size;
  }
};

struct Archive {
  size_t base_offset;
  std::vector<ArchiveEntry> entries;

  inline size_t entry_offset(size_t index) const {
    return this->base_offset + this->entries.at(index).offset;
  }
  bool operator==(const Archive& other) const;
};

struct ArchiveScanConfig {
  uint16_t magic = 0x3232;
  size_t max_depth = 3;
  size_t scan_alignment = 2;
};

// Returns nullopt (never throws) if the header at offset is not a valid archive
std::optional<Archive> try_parse_archive(
    const ByteBuffer& buf, size_t offset, const ArchiveScanConfig& config = ArchiveScanConfig());

struct LocatedArchive {
  // Opaque location key, e.g. "off=0x1EC000/idx=0"
  std::string location;
  size_t depth;
  Archive archive;
};

// Breadth-first traversal of all archives in a buffer. The constructor does
// the full-buffer scan for top-level headers; nested archives are discovered
// lazily as next() is called.
class ArchiveWalker {
public:
  ArchiveWalker(
      const ByteBuffer& buf,
      const ArchiveScanConfig& config = ArchiveScanConfig(),
      const ScanControl* control = nullptr);
  ~ArchiveWalker() = default;

  std::optional<LocatedArchive> next();

private:
  const ByteBuffer& buf;
  ArchiveScanConfig config;
  std::deque<LocatedArchive> queue;
};

std::vector<LocatedArchive> scan_archives(
    const ByteBuffer& buf,
    const ArchiveScanConfig& config = ArchiveScanConfig(),
    const ScanControl* control = nullptr);

std::string format_archive_location(size_t offset);
std::string format_archive_location(const std::string& parent, size_t entry_index);

} // namespace ToyBinDASM
