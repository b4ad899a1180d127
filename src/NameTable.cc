#include "NameTable.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "ArchiveScanner.hh"

using namespace std;

namespace ToyBinDASM {

NameTable::NameTable(const NameCodec& codec, vector<TextArchive>&& archives)
    : codec(codec),
      archives(std::move(archives)) {}

NameTable NameTable::open(
    const ByteBuffer& buf, const DeviceProfile& profile, const NameCodec& codec, const ScanControl* control) {
  vector<TextArchive> archives;
  ArchiveWalker walker(buf, profile.archive_config, control);
  while (auto located = walker.next()) {
    for (auto& text : find_text_archives(buf, *located)) {
      if (profile.is_name_archive_location(text.location)) {
        phosg::log_info_f("Name archive {} at 0x{:X} has {} strings",
            text.location, text.base_offset, text.string_count());
        archives.emplace_back(std::move(text));
      }
    }
  }
  if (archives.empty()) {
    throw runtime_error(std::format("no name archive found for device {}", profile.name));
  }
  return NameTable(codec, std::move(archives));
}

size_t NameTable::size() const {
  size_t ret = 0;
  for (const auto& archive : this->archives) {
    ret += archive.string_count();
  }
  return ret;
}

const TextArchive& NameTable::archive_for_location(const string& location) const {
  for (const auto& archive : this->archives) {
    if (archive.location == location) {
      return archive;
    }
  }
  throw out_of_range(std::format("no name archive at {}", location));
}

pair<const TextArchive*, size_t> NameTable::resolve(size_t global_index) const {
  size_t remaining = global_index;
  for (const auto& archive : this->archives) {
    if (remaining < archive.string_count()) {
      return make_pair(&archive, remaining);
    }
    remaining -= archive.string_count();
  }
  throw out_of_range(std::format("string index {} is out of range", global_index));
}

string NameTable::decode_name(const ByteBuffer& buf, size_t global_index) const {
  auto [archive, index] = this->resolve(global_index);
  return this->codec.decode(buf, *archive, index);
}

string NameTable::decode_name(const ByteBuffer& buf, const string& location, size_t index) const {
  const auto& archive = this->archive_for_location(location);
  if (index >= archive.string_count()) {
    throw out_of_range(std::format("string index {} is out of range for {}", index, location));
  }
  return this->codec.decode(buf, archive, index);
}

NameUpdateResult NameTable::update_name(
    PatchApplier& patcher, size_t global_index, const string& new_name, const NameUpdateStrategy& strategy) const {
  if (global_index >= this->size()) {
    return NameUpdateResult::SKIPPED_OUT_OF_RANGE;
  }
  auto [archive, index] = this->resolve(global_index);
  return strategy.apply(patcher, *archive, index, new_name);
}

NameUpdateResult NameTable::update_name(
    PatchApplier& patcher,
    const string& location,
    size_t index,
    const string& new_name,
    const NameUpdateStrategy& strategy) const {
  for (const auto& archive : this->archives) {
    if (archive.location == location) {
      return strategy.apply(patcher, archive, index, new_name);
    }
  }
  return NameUpdateResult::SKIPPED_OUT_OF_RANGE;
}

vector<NameTable::LocalRef> NameTable::select(const vector<uint16_t>& indexes) const {
  vector<LocalRef> ret;
  for (const auto& archive : this->archives) {
    for (uint16_t index : indexes) {
      if (index < archive.string_count()) {
        ret.emplace_back(LocalRef{&archive, index});
      }
    }
  }
  return ret;
}

} // namespace ToyBinDASM
