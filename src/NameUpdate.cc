#include "NameUpdate.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>

#include "TextCodecs.hh"

using namespace std;

namespace ToyBinDASM {

const char* name_for_name_update_result(NameUpdateResult res) {
  switch (res) {
    case NameUpdateResult::UPDATED:
      return "updated";
    case NameUpdateResult::PADDED:
      return "padded";
    case NameUpdateResult::TRIMMED:
      return "trimmed";
    case NameUpdateResult::UNCHANGED:
      return "unchanged";
    case NameUpdateResult::SKIPPED_FORBIDDEN:
      return "skipped (forbidden characters)";
    case NameUpdateResult::SKIPPED_SIZE_MISMATCH:
      return "skipped (encoded size differs from existing string)";
    case NameUpdateResult::SKIPPED_TOO_LONG:
      return "skipped (longer than existing name)";
    case NameUpdateResult::SKIPPED_CAPACITY:
      return "skipped (does not fit in slot)";
    case NameUpdateResult::SKIPPED_ENCODE_ERROR:
      return "skipped (cannot be encoded)";
    case NameUpdateResult::SKIPPED_OUT_OF_RANGE:
      return "skipped (no such string)";
  }
  throw logic_error("invalid name update result");
}

bool name_update_succeeded(NameUpdateResult res) {
  return (res == NameUpdateResult::UPDATED) ||
      (res == NameUpdateResult::PADDED) ||
      (res == NameUpdateResult::TRIMMED);
}

void add_to_summary(PatchSummary& summary, NameUpdateResult res, const string& description) {
  switch (res) {
    case NameUpdateResult::UPDATED:
      summary.updated++;
      break;
    case NameUpdateResult::PADDED:
      summary.updated++;
      summary.padded++;
      break;
    case NameUpdateResult::TRIMMED:
      summary.updated++;
      summary.trimmed++;
      break;
    case NameUpdateResult::UNCHANGED:
      break;
    default:
      summary.skip(std::format("{}: {}", description, name_for_name_update_result(res)));
      phosg::log_warning_f("{}: {}", description, name_for_name_update_result(res));
  }
}

bool contains_forbidden_chars(const string& s, const string& forbidden_chars) {
  return s.find_first_of(forbidden_chars) != string::npos;
}

NameUpdateStrategy::NameUpdateStrategy(const NameCodec& codec, const string& forbidden_chars)
    : codec(codec),
      forbidden_chars(forbidden_chars) {}

NameUpdateResult ExactByteLengthStrategy::apply(
    PatchApplier& patcher, const TextArchive& archive, size_t index, const string& new_name) const {
  if (index >= archive.string_count()) {
    return NameUpdateResult::SKIPPED_OUT_OF_RANGE;
  }
  if (contains_forbidden_chars(new_name, this->forbidden_chars)) {
    return NameUpdateResult::SKIPPED_FORBIDDEN;
  }

  string encoded;
  try {
    encoded = encode_string_codes(this->codec.encode(new_name));
  } catch (const TextEncodeError&) {
    return NameUpdateResult::SKIPPED_ENCODE_ERROR;
  }

  size_t offset = archive.string_offset(index);
  size_t capacity = archive.string_capacity(index);
  if ((encoded.size() == capacity) && (patcher.buffer().read(offset, capacity) == encoded)) {
    return NameUpdateResult::UNCHANGED;
  }
  switch (patcher.apply_exact(offset, encoded, capacity)) {
    case PatchResult::WRITTEN:
      return NameUpdateResult::UPDATED;
    case PatchResult::REJECTED_BOUNDS:
      return NameUpdateResult::SKIPPED_OUT_OF_RANGE;
    default:
      return NameUpdateResult::SKIPPED_SIZE_MISMATCH;
  }
}

PadToDisplayLengthStrategy::PadToDisplayLengthStrategy(
    const NameCodec& codec, const string& forbidden_chars, const string& filler, OverflowPolicy overflow)
    : NameUpdateStrategy(codec, forbidden_chars),
      filler(filler),
      overflow(overflow) {}

NameUpdateResult PadToDisplayLengthStrategy::apply(
    PatchApplier& patcher, const TextArchive& archive, size_t index, const string& new_name) const {
  if (index >= archive.string_count()) {
    return NameUpdateResult::SKIPPED_OUT_OF_RANGE;
  }
  if (contains_forbidden_chars(new_name, this->forbidden_chars)) {
    return NameUpdateResult::SKIPPED_FORBIDDEN;
  }

  const ByteBuffer& buf = patcher.buffer();
  string old_name = this->codec.decode(buf, archive, index);
  if (new_name == old_name) {
    return NameUpdateResult::UNCHANGED;
  }
  size_t old_length = utf8_length(old_name);
  size_t new_length = utf8_length(new_name);
  if (new_length > old_length) {
    return NameUpdateResult::SKIPPED_TOO_LONG;
  }

  string name_to_write = new_name;
  bool padded = false;
  if ((new_length < old_length) && !this->filler.empty()) {
    for (size_t z = new_length; z < old_length; z++) {
      name_to_write += this->filler;
    }
    padded = true;
  }

  vector<uint16_t> codes;
  try {
    codes = this->codec.encode(name_to_write);
  } catch (const TextEncodeError&) {
    return NameUpdateResult::SKIPPED_ENCODE_ERROR;
  }

  size_t capacity = archive.string_capacity(index);
  string encoded = encode_string_codes(codes);
  bool trimmed = false;
  if (encoded.size() > capacity) {
    auto fitted = encode_for_slot(codes, capacity, this->overflow);
    if (!fitted) {
      return NameUpdateResult::SKIPPED_CAPACITY;
    }
    encoded = std::move(*fitted);
    trimmed = true;
  }

  // Zero the remainder of the old string so no stale codes follow the new
  // terminator
  size_t span = max(encoded.size(), archive.string_occupied_size(buf, index));
  auto res = patcher.apply_fitted(archive.string_offset(index), encoded, span, FitPolicy::PAD, 0x00);
  if (!patch_succeeded(res)) {
    return (res == PatchResult::REJECTED_BOUNDS)
        ? NameUpdateResult::SKIPPED_OUT_OF_RANGE
        : NameUpdateResult::SKIPPED_CAPACITY;
  }
  if (trimmed) {
    return NameUpdateResult::TRIMMED;
  }
  return (padded || (res == PatchResult::PADDED)) ? NameUpdateResult::PADDED : NameUpdateResult::UPDATED;
}

} // namespace ToyBinDASM
