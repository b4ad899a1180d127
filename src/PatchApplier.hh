#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "ByteBuffer.hh"

namespace ToyBinDASM {

enum class FitPolicy {
  REJECT = 0, // Data must not be larger than the slot; shorter data is written as-is
  TRUNCATE, // Longer data is cut to the slot size
  PAD, // Shorter data is padded to the slot size; longer data is rejected
  PAD_OR_TRUNCATE, // Always fills the slot exactly
};

enum class PatchResult {
  WRITTEN = 0,
  TRUNCATED,
  PADDED,
  REJECTED_SIZE,
  REJECTED_BOUNDS,
};

inline bool patch_succeeded(PatchResult res) {
  return (res == PatchResult::WRITTEN) || (res == PatchResult::TRUNCATED) || (res == PatchResult::PADDED);
}

const char* name_for_patch_result(PatchResult res);

struct PatchSummary {
  size_t updated = 0;
  size_t skipped = 0;
  size_t trimmed = 0;
  size_t padded = 0;
  std::vector<std::string> messages;

  void add(PatchResult res);
  void skip(const std::string& message);
  void merge(const PatchSummary& other);
  std::string str() const;
};

// The only path by which any editing flow modifies a ByteBuffer. All checks
// happen before the write, so a rejected patch leaves the buffer untouched,
// and no patch can change the buffer's size.
class PatchApplier {
public:
  explicit PatchApplier(ByteBuffer& buf, bool dry_run = false);
  ~PatchApplier() = default;

  // Requires data.size() == capacity
  PatchResult apply_exact(size_t offset, const std::string& data, size_t capacity);
  PatchResult apply_fitted(
      size_t offset, const std::string& data, size_t capacity, FitPolicy policy, uint8_t pad_byte = 0x00);
  // Writes data into a region that must lie within the buffer (no capacity
  // semantics; used for fixed-size table fields)
  PatchResult apply_in_place(size_t offset, const std::string& data);
  PatchResult apply_u16l(size_t offset, uint16_t value);

  inline const ByteBuffer& buffer() const {
    return this->buf;
  }
  inline bool is_dry_run() const {
    return this->dry_run;
  }
  inline size_t write_count() const {
    return this->num_writes;
  }

private:
  void commit(size_t offset, const std::string& data);

  ByteBuffer& buf;
  bool dry_run;
  size_t num_writes;
};

} // namespace ToyBinDASM
