#include "TextArchive.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "TextCodecs.hh"

using namespace std;

namespace ToyBinDASM {

OverflowPolicy parse_overflow_policy(const string& name) {
  if (name == "reject" || name == "error") {
    return OverflowPolicy::REJECT;
  } else if (name == "truncate") {
    return OverflowPolicy::TRUNCATE;
  }
  throw invalid_argument(std::format("unknown overflow policy: {}", name));
}

size_t TextArchive::string_capacity(size_t index) const {
  size_t start = this->word_offsets.at(index) * 2;
  size_t end = (index + 1 < this->word_offsets.size())
      ? (this->word_offsets[index + 1] * 2)
      : this->size;
  return (end > start) ? (end - start) : 0;
}

size_t TextArchive::string_occupied_size(const ByteBuffer& buf, size_t index) const {
  size_t capacity = this->string_capacity(index);
  size_t start = this->string_offset(index);
  for (size_t z = 0; z + 2 <= capacity; z += 2) {
    if (buf.u16l(start + z) == 0) {
      return z + 2;
    }
  }
  return capacity;
}

optional<TextArchive> try_parse_text_archive(
    const ByteBuffer& buf,
    size_t offset,
    size_t size,
    const string& location,
    const TextArchiveConfig& config) {
  if ((size < 4) || !buf.contains(offset, size)) {
    return nullopt;
  }
  auto r = buf.view(offset, size);

  size_t count = r.get_u16l();
  if ((count < 1) || (count > config.max_string_count)) {
    return nullopt;
  }
  if (2 + 2 * count > size) {
    return nullopt;
  }

  TextArchive ret;
  ret.location = location;
  ret.base_offset = offset;
  ret.size = size;
  ret.word_offsets.reserve(count);
  uint16_t prev = 0;
  for (size_t z = 0; z < count; z++) {
    uint16_t word_offset = r.get_u16l();
    if ((word_offset < prev) || (static_cast<size_t>(word_offset) * 2 >= size)) {
      return nullopt;
    }
    ret.word_offsets.emplace_back(word_offset);
    prev = word_offset;
  }

  for (uint16_t word_offset : ret.word_offsets) {
    size_t start = word_offset * 2;
    bool terminated = false;
    for (size_t pos = start; (pos + 2 <= size) && (pos - start <= config.terminator_scan_window); pos += 2) {
      if (r.pget_u16l(pos) == 0) {
        terminated = true;
        break;
      }
    }
    if (!terminated) {
      return nullopt;
    }
  }

  return ret;
}

vector<TextArchive> find_text_archives(
    const ByteBuffer& buf, const LocatedArchive& archive, const TextArchiveConfig& config) {
  vector<TextArchive> ret;
  for (size_t z = 0; z < archive.archive.entries.size(); z++) {
    const auto& entry = archive.archive.entries[z];
    if (entry.is_compressed()) {
      continue;
    }
    size_t offset = archive.archive.entry_offset(z);
    size_t size = entry.data_size();
    if ((size == 0) || (offset >= buf.size())) {
      continue;
    }
    size = min<size_t>(size, buf.size() - offset);
    auto text = try_parse_text_archive(
        buf, offset, size, format_archive_location(archive.location, z), config);
    if (text) {
      ret.emplace_back(std::move(*text));
    }
  }
  return ret;
}

vector<uint16_t> decode_string_codes(const ByteBuffer& buf, const TextArchive& archive, size_t index) {
  auto r = buf.view(archive.base_offset, archive.size);
  r.go(archive.word_offsets.at(index) * 2);

  vector<uint16_t> ret;
  while (r.remaining() >= 2) {
    uint16_t code = r.get_u16l();
    if (code == 0) {
      break;
    }
    if (!is_control_code(code)) {
      ret.emplace_back(code);
    }
  }
  return ret;
}

string encode_string_codes(const vector<uint16_t>& codes) {
  phosg::StringWriter w;
  for (uint16_t code : codes) {
    w.put_u16l(code);
  }
  w.put_u16l(0);
  return w.str();
}

optional<string> encode_for_slot(const vector<uint16_t>& codes, size_t capacity, OverflowPolicy policy) {
  string ret = encode_string_codes(codes);
  if (ret.size() <= capacity) {
    return ret;
  }
  if (policy == OverflowPolicy::REJECT) {
    return nullopt;
  }
  size_t max_codes = (capacity >= 2) ? (capacity / 2 - 1) : 0;
  vector<uint16_t> truncated(codes.begin(), codes.begin() + min(max_codes, codes.size()));
  ret = encode_string_codes(truncated);
  if (ret.size() > capacity) {
    // Not even a terminator fits
    return nullopt;
  }
  return ret;
}

} // namespace ToyBinDASM
