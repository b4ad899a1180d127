#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "ByteBuffer.hh"
#include "DeviceProfile.hh"
#include "PatchApplier.hh"

namespace ToyBinDASM {

struct PartnerStats {
  size_t slot; // Row number within the table
  uint16_t string_index;
  uint16_t stage; // Always 0 for DIGIVICE_SPLIT_RECORDS
  uint16_t power;
  uint16_t unknown1;
  uint16_t unknown2;
  size_t offset; // Absolute offset of the partner's first word
};

// Throws out_of_range if a D3 table runs past the end of the buffer. Digivice
// tables end at the first all-zero partner or where the next record would
// leave the buffer.
std::vector<PartnerStats> read_partner_stats(const ByteBuffer& buf, const StatTableConfig& config);

// Writes rows back in table order (the slot field of each row is ignored for
// D3 tables, whose layout is rebuilt from the sequence of rows). A power value
// above config.max_power keeps the existing power and is reported as a skip.
PatchSummary write_partner_stats(
    PatchApplier& patcher, const StatTableConfig& config, const std::vector<PartnerStats>& rows);

} // namespace ToyBinDASM
