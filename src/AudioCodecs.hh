#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

namespace ToyBinDASM {

// GeneralPlus 4-bit ADPCM, as used by the SPF2ALP sound blocks. Each byte holds
// two codes, low nibble first. Code bits:
//   SMMM
//   S = sign (subtract the difference from the predictor)
//   M = magnitude bits selecting step, step >> 1, and step >> 2
struct AdpcmConfig {
  int16_t step_table[16] = {16, 17, 19, 21, 23, 25, 28, 31, 34, 37, 41, 45, 50, 55, 60, 66};
  int32_t max_amplitude = 2047;
  int32_t output_scale = 16;
};

// The running codec state. Both halves of the codec start from the default
// state at the beginning of a block; a stream can be resumed from any
// checkpointed state.
struct AdpcmState {
  int32_t predictor = 0;
  int32_t step_index = 0;

  // Applies one code to the state and returns the new (unscaled) predictor
  int32_t apply(uint8_t code, const AdpcmConfig& config);
};

std::vector<int16_t> decode_gp_adpcm(
    const void* data, size_t size, const AdpcmConfig& config = AdpcmConfig(), AdpcmState* state = nullptr);
std::vector<int16_t> decode_gp_adpcm(const std::string& data, const AdpcmConfig& config = AdpcmConfig());

std::string encode_gp_adpcm(
    const std::vector<int16_t>& pcm, const AdpcmConfig& config = AdpcmConfig(), AdpcmState* state = nullptr);

} // namespace ToyBinDASM
