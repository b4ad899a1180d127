#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "ByteBuffer.hh"
#include "DeviceProfile.hh"
#include "NameUpdate.hh"
#include "ReplacementTable.hh"
#include "ScanControl.hh"
#include "TextArchive.hh"

namespace ToyBinDASM {

// The text archives that hold a device's character names. Strings are
// addressed either by (location, index) within one archive, or by a global
// index that numbers the strings of all name archives consecutively, in scan
// order.
class NameTable {
public:
  NameTable(const NameCodec& codec, std::vector<TextArchive>&& archives);
  ~NameTable() = default;

  // Throws runtime_error if none of the profile's name archives is present
  static NameTable open(
      const ByteBuffer& buf,
      const DeviceProfile& profile,
      const NameCodec& codec,
      const ScanControl* control = nullptr);

  inline const std::vector<TextArchive>& get_archives() const {
    return this->archives;
  }
  size_t size() const;

  // Both of these throw out_of_range for unknown locations or indexes
  const TextArchive& archive_for_location(const std::string& location) const;
  std::pair<const TextArchive*, size_t> resolve(size_t global_index) const;

  std::string decode_name(const ByteBuffer& buf, size_t global_index) const;
  std::string decode_name(const ByteBuffer& buf, const std::string& location, size_t index) const;

  // Per-record failures are returned, not thrown; an unknown global index is
  // SKIPPED_OUT_OF_RANGE
  NameUpdateResult update_name(
      PatchApplier& patcher, size_t global_index, const std::string& new_name, const NameUpdateStrategy& strategy) const;
  NameUpdateResult update_name(
      PatchApplier& patcher,
      const std::string& location,
      size_t index,
      const std::string& new_name,
      const NameUpdateStrategy& strategy) const;

  struct LocalRef {
    const TextArchive* archive;
    size_t index;
  };
  // The given per-archive indexes, for every name archive that has them
  std::vector<LocalRef> select(const std::vector<uint16_t>& indexes) const;

private:
  const NameCodec& codec;
  std::vector<TextArchive> archives;
};

} // namespace ToyBinDASM
