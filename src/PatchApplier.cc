#include "PatchApplier.hh"

#include <format>
#include <phosg/Encoding.hh>
#include <stdexcept>

using namespace std;

namespace ToyBinDASM {

const char* name_for_patch_result(PatchResult res) {
  switch (res) {
    case PatchResult::WRITTEN:
      return "written";
    case PatchResult::TRUNCATED:
      return "truncated";
    case PatchResult::PADDED:
      return "padded";
    case PatchResult::REJECTED_SIZE:
      return "rejected (size)";
    case PatchResult::REJECTED_BOUNDS:
      return "rejected (out of bounds)";
  }
  throw logic_error("invalid patch result");
}

void PatchSummary::add(PatchResult res) {
  switch (res) {
    case PatchResult::WRITTEN:
      this->updated++;
      break;
    case PatchResult::TRUNCATED:
      this->updated++;
      this->trimmed++;
      break;
    case PatchResult::PADDED:
      this->updated++;
      this->padded++;
      break;
    case PatchResult::REJECTED_SIZE:
    case PatchResult::REJECTED_BOUNDS:
      this->skipped++;
      break;
  }
}

void PatchSummary::skip(const string& message) {
  this->skipped++;
  this->messages.emplace_back(message);
}

void PatchSummary::merge(const PatchSummary& other) {
  this->updated += other.updated;
  this->skipped += other.skipped;
  this->trimmed += other.trimmed;
  this->padded += other.padded;
  this->messages.insert(this->messages.end(), other.messages.begin(), other.messages.end());
}

string PatchSummary::str() const {
  return std::format("{} updated, {} skipped, {} trimmed, {} padded",
      this->updated, this->skipped, this->trimmed, this->padded);
}

PatchApplier::PatchApplier(ByteBuffer& buf, bool dry_run)
    : buf(buf),
      dry_run(dry_run),
      num_writes(0) {}

void PatchApplier::commit(size_t offset, const string& data) {
  if (!this->dry_run) {
    this->buf.write(offset, data);
  }
  this->num_writes++;
}

PatchResult PatchApplier::apply_exact(size_t offset, const string& data, size_t capacity) {
  if (data.size() != capacity) {
    return PatchResult::REJECTED_SIZE;
  }
  if (!this->buf.contains(offset, capacity)) {
    return PatchResult::REJECTED_BOUNDS;
  }
  this->commit(offset, data);
  return PatchResult::WRITTEN;
}

PatchResult PatchApplier::apply_fitted(
    size_t offset, const string& data, size_t capacity, FitPolicy policy, uint8_t pad_byte) {
  if (!this->buf.contains(offset, capacity)) {
    return PatchResult::REJECTED_BOUNDS;
  }

  if (data.size() > capacity) {
    if ((policy == FitPolicy::TRUNCATE) || (policy == FitPolicy::PAD_OR_TRUNCATE)) {
      this->commit(offset, data.substr(0, capacity));
      return PatchResult::TRUNCATED;
    }
    return PatchResult::REJECTED_SIZE;
  }

  if ((data.size() < capacity) && ((policy == FitPolicy::PAD) || (policy == FitPolicy::PAD_OR_TRUNCATE))) {
    string padded = data;
    padded.resize(capacity, static_cast<char>(pad_byte));
    this->commit(offset, padded);
    return PatchResult::PADDED;
  }

  this->commit(offset, data);
  return PatchResult::WRITTEN;
}

PatchResult PatchApplier::apply_in_place(size_t offset, const string& data) {
  if (!this->buf.contains(offset, data.size())) {
    return PatchResult::REJECTED_BOUNDS;
  }
  this->commit(offset, data);
  return PatchResult::WRITTEN;
}

PatchResult PatchApplier::apply_u16l(size_t offset, uint16_t value) {
  phosg::le_uint16_t le_value = value;
  return this->apply_in_place(offset, string(reinterpret_cast<const char*>(&le_value), sizeof(le_value)));
}

} // namespace ToyBinDASM
