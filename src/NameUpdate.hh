#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "PatchApplier.hh"
#include "ReplacementTable.hh"
#include "TextArchive.hh"

namespace ToyBinDASM {

enum class NameUpdateResult {
  UPDATED = 0,
  PADDED,
  TRIMMED,
  UNCHANGED,
  SKIPPED_FORBIDDEN,
  SKIPPED_SIZE_MISMATCH,
  SKIPPED_TOO_LONG,
  SKIPPED_CAPACITY,
  SKIPPED_ENCODE_ERROR,
  SKIPPED_OUT_OF_RANGE,
};

const char* name_for_name_update_result(NameUpdateResult res);
bool name_update_succeeded(NameUpdateResult res);
void add_to_summary(PatchSummary& summary, NameUpdateResult res, const std::string& description);

bool contains_forbidden_chars(const std::string& s, const std::string& forbidden_chars);

// Decides whether and how a new display name replaces an existing string.
// Strings never move, so no strategy may write outside the existing slot.
class NameUpdateStrategy {
public:
  NameUpdateStrategy(const NameCodec& codec, const std::string& forbidden_chars);
  virtual ~NameUpdateStrategy() = default;

  virtual NameUpdateResult apply(
      PatchApplier& patcher, const TextArchive& archive, size_t index, const std::string& new_name) const = 0;

protected:
  const NameCodec& codec;
  std::string forbidden_chars;
};

// Accepts a name only if its encoding is exactly as long as the existing slot
class ExactByteLengthStrategy : public NameUpdateStrategy {
public:
  using NameUpdateStrategy::NameUpdateStrategy;
  virtual ~ExactByteLengthStrategy() = default;

  virtual NameUpdateResult apply(
      PatchApplier& patcher, const TextArchive& archive, size_t index, const std::string& new_name) const;
};

// Keeps the old display length: longer names are refused, shorter names are
// padded with the filler character (if any) up to the old length. If the
// encoding is shorter than the old string, the rest of the old string's bytes
// are zeroed.
class PadToDisplayLengthStrategy : public NameUpdateStrategy {
public:
  PadToDisplayLengthStrategy(
      const NameCodec& codec,
      const std::string& forbidden_chars,
      const std::string& filler = "_",
      OverflowPolicy overflow = OverflowPolicy::REJECT);
  virtual ~PadToDisplayLengthStrategy() = default;

  virtual NameUpdateResult apply(
      PatchApplier& patcher, const TextArchive& archive, size_t index, const std::string& new_name) const;

private:
  std::string filler;
  OverflowPolicy overflow;
};

} // namespace ToyBinDASM
