#pragma once

#include <stddef.h>
#include <stdint.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "Audio/WAVFile.hh"
#include "AudioCodecs.hh"
#include "ByteBuffer.hh"
#include "PatchApplier.hh"

namespace ToyBinDASM {

// Raised when replacement audio cannot be turned into a payload (bad input
// format, empty encoder output). Import flows count it as a skip.
class CodecFailure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// SPF2ALP sound blocks. Each block runs from its magic to the next magic (or
// the end of the buffer); the ADPCM payload fills everything after the
// 0x40-byte header.
constexpr size_t SPF2ALP_HEADER_SIZE = 0x40;
constexpr uint32_t SPF2ALP_DEFAULT_SAMPLE_RATE = 44100;
constexpr uint32_t SPF2ALP_MAX_SAMPLE_RATE = 192000;

struct SPF2ALPBlock {
  // Counts every magic found, including blocks that were too small to keep,
  // so indexes stay stable across exports and imports
  size_t index;
  size_t start;
  size_t end;
  uint32_t sample_rate;

  inline size_t payload_offset() const {
    return this->start + SPF2ALP_HEADER_SIZE;
  }
  inline size_t slot_size() const {
    return this->end - this->payload_offset();
  }
};

std::vector<SPF2ALPBlock> scan_spf2alp_blocks(const ByteBuffer& buf);

// A18 chunks: [u16 payload size][00 00 80 3E][payload]. The codec itself is
// not handled here; chunks are exported and reinjected as raw bytes.
constexpr size_t A18_CHUNK_HEADER_SIZE = 6;
constexpr size_t A18_MAX_PAYLOAD_SIZE = 0x200000;
constexpr uint32_t A18_DEFAULT_SAMPLE_RATE = 16000;
extern const std::string A18_MARKER;

struct A18Chunk {
  size_t index;
  size_t start;
  size_t payload_size;

  inline size_t end() const {
    return this->start + A18_CHUNK_HEADER_SIZE + this->payload_size;
  }
  inline size_t slot_size() const {
    return A18_CHUNK_HEADER_SIZE + this->payload_size;
  }
};

std::vector<A18Chunk> scan_a18_chunks(const ByteBuffer& buf);

// Finds the chunk within an encoder's output file, which may be wrapped in a
// container header. A chunk whose declared payload runs up to 4 bytes past the
// end of the data is accepted and zero-filled. Returns nullopt if there is no
// usable chunk.
std::optional<std::string> extract_a18_chunk(const std::string& raw);

struct PcmConditioning {
  double target_rms_dbfs = -12.0;
  double limit_ceiling = 0.98;
};

// Mixes to mono, resamples linearly to target_rate, then normalizes loudness
// and limits peaks. Throws CodecFailure if the result would be empty.
std::vector<int16_t> condition_pcm(
    const Audio::SampledSound& sound, uint32_t target_rate, const PcmConditioning& options = PcmConditioning());

std::vector<int16_t> decode_spf2alp_block(
    const ByteBuffer& buf, const SPF2ALPBlock& block, const AdpcmConfig& config = AdpcmConfig());

// Encodes pcm and writes it into the block's payload slot, truncating or
// zero-padding to the slot size. Throws CodecFailure if nothing was encoded.
PatchResult import_spf2alp_payload(
    PatchApplier& patcher, const SPF2ALPBlock& block, const std::vector<int16_t>& pcm,
    const AdpcmConfig& config = AdpcmConfig());

// Writes a chunk (as produced by extract_a18_chunk) over an existing one. A
// larger payload is cut to the slot and its size field rewritten; a smaller
// chunk is zero-padded to the slot.
PatchResult import_a18_chunk(PatchApplier& patcher, const A18Chunk& slot, const std::string& chunk);

} // namespace ToyBinDASM
