#include "ArchiveScanner.hh"

#include <format>

using namespace std;

namespace ToyBinDASM {

bool Archive::operator==(const Archive& other) const {
  if ((this->base_offset != other.base_offset) || (this->entries.size() != other.entries.size())) {
    return false;
  }
  for (size_t z = 0; z < this->entries.size(); z++) {
    const auto& a = this->entries[z];
    const auto& b = other.entries[z];
    if ((a.flags != b.flags) ||
        (a.offset != b.offset) ||
        (a.compressed_size != b.compressed_size) ||
        (a.decompressed_size != b.decompressed_size)) {
      return false;
    }
  }
  return true;
}

optional<Archive> try_parse_archive(const ByteBuffer& buf, size_t offset, const ArchiveScanConfig& config) {
  if (!buf.contains(offset, sizeof(ArchiveHeader))) {
    return nullopt;
  }
  auto r = buf.reader();
  const auto& header = r.pget<ArchiveHeader>(offset);
  if (header.magic != config.magic) {
    return nullopt;
  }
  size_t entry_count = header.entry_count;
  if (entry_count == 0) {
    return nullopt;
  }
  size_t table_offset = offset + sizeof(ArchiveHeader);
  if (!buf.contains(table_offset, entry_count * sizeof(ArchiveEntryHeader))) {
    return nullopt;
  }

  Archive ret;
  ret.base_offset = offset;
  ret.entries.reserve(entry_count);
  for (size_t z = 0; z < entry_count; z++) {
    const auto& entry = r.pget<ArchiveEntryHeader>(table_offset + z * sizeof(ArchiveEntryHeader));
    if (offset + entry.offset > buf.size()) {
      return nullopt;
    }
    ret.entries.emplace_back(ArchiveEntry{
        entry.flags, entry.offset, entry.compressed_size, entry.decompressed_size});
  }
  return ret;
}

string format_archive_location(size_t offset) {
  return std::format("off=0x{:X}", offset);
}

string format_archive_location(const string& parent, size_t entry_index) {
  return std::format("{}/idx={}", parent, entry_index);
}

ArchiveWalker::ArchiveWalker(const ByteBuffer& buf, const ArchiveScanConfig& config, const ScanControl* control)
    : buf(buf),
      config(config) {
  size_t end_offset = (buf.size() > 4) ? (buf.size() - 4) : 0;
  for (size_t offset = 0; offset < end_offset; offset += this->config.scan_alignment) {
    if (control) {
      control->step(offset, end_offset);
    }
    auto archive = try_parse_archive(this->buf, offset, this->config);
    if (archive) {
      this->queue.emplace_back(LocatedArchive{format_archive_location(offset), 0, std::move(*archive)});
    }
  }
  if (control && control->on_progress) {
    control->on_progress(end_offset, end_offset);
  }
}

optional<LocatedArchive> ArchiveWalker::next() {
  if (this->queue.empty()) {
    return nullopt;
  }
  LocatedArchive ret = std::move(this->queue.front());
  this->queue.pop_front();

  if (ret.depth < this->config.max_depth) {
    for (size_t z = 0; z < ret.archive.entries.size(); z++) {
      if (ret.archive.entries[z].is_compressed()) {
        continue;
      }
      auto sub = try_parse_archive(this->buf, ret.archive.entry_offset(z), this->config);
      if (sub) {
        this->queue.emplace_back(LocatedArchive{
            format_archive_location(ret.location, z), ret.depth + 1, std::move(*sub)});
      }
    }
  }
  return ret;
}

vector<LocatedArchive> scan_archives(const ByteBuffer& buf, const ArchiveScanConfig& config, const ScanControl* control) {
  vector<LocatedArchive> ret;
  ArchiveWalker walker(buf, config, control);
  for (auto item = walker.next(); item; item = walker.next()) {
    ret.emplace_back(std::move(*item));
  }
  return ret;
}

} // namespace ToyBinDASM
