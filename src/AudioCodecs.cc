#include "AudioCodecs.hh"

#include <stdint.h>

#include <phosg/Strings.hh>
#include <string>
#include <vector>

using namespace std;

namespace ToyBinDASM {

int32_t AdpcmState::apply(uint8_t code, const AdpcmConfig& config) {
  int32_t step = config.step_table[this->step_index];

  int32_t diff = step >> 3;
  if (code & 1) {
    diff += step >> 2;
  }
  if (code & 2) {
    diff += step >> 1;
  }
  if (code & 4) {
    diff += step;
  }
  if (code & 8) {
    diff = -diff;
  }

  this->predictor += diff;
  if (this->predictor > config.max_amplitude) {
    this->predictor = config.max_amplitude;
  } else if (this->predictor < -config.max_amplitude) {
    this->predictor = -config.max_amplitude;
  }

  this->step_index += (code & 7) - 4;
  if (this->step_index < 0) {
    this->step_index = 0;
  } else if (this->step_index > 15) {
    this->step_index = 15;
  }

  return this->predictor;
}

vector<int16_t> decode_gp_adpcm(const void* data, size_t size, const AdpcmConfig& config, AdpcmState* state) {
  AdpcmState local_state;
  AdpcmState& st = state ? *state : local_state;

  phosg::StringReader r(data, size);
  vector<int16_t> ret;
  ret.reserve(size * 2);
  while (!r.eof()) {
    uint8_t value = r.get_u8();
    ret.emplace_back(st.apply(value & 0x0F, config) * config.output_scale);
    ret.emplace_back(st.apply(value >> 4, config) * config.output_scale);
  }
  return ret;
}

vector<int16_t> decode_gp_adpcm(const string& data, const AdpcmConfig& config) {
  return decode_gp_adpcm(data.data(), data.size(), config);
}

// Floor division, so negative samples quantize the same way they would with
// an arithmetic shift
static int32_t quantize_sample(int16_t sample, const AdpcmConfig& config) {
  int32_t v = sample;
  int32_t q = v / config.output_scale;
  if ((v % config.output_scale != 0) && (v < 0)) {
    q--;
  }
  if (q > config.max_amplitude) {
    return config.max_amplitude;
  }
  if (q < -config.max_amplitude) {
    return -config.max_amplitude;
  }
  return q;
}

static uint8_t choose_code(int32_t target, const AdpcmState& st, const AdpcmConfig& config) {
  int32_t diff = target - st.predictor;
  uint8_t code = 0;
  if (diff < 0) {
    code |= 8;
    diff = -diff;
  }

  int32_t step = config.step_table[st.step_index];
  if (diff >= step) {
    code |= 4;
    diff -= step;
  }
  if (diff >= (step >> 1)) {
    code |= 2;
    diff -= (step >> 1);
  }
  if (diff >= (step >> 2)) {
    code |= 1;
  }
  return code;
}

string encode_gp_adpcm(const vector<int16_t>& pcm, const AdpcmConfig& config, AdpcmState* state) {
  AdpcmState local_state;
  AdpcmState& st = state ? *state : local_state;

  phosg::StringWriter w;
  uint8_t pending = 0;
  bool have_low_nibble = false;
  for (int16_t sample : pcm) {
    uint8_t code = choose_code(quantize_sample(sample, config), st, config);
    // The decoder's update is applied here so both sides track the same
    // reconstructed predictor
    st.apply(code, config);

    if (!have_low_nibble) {
      pending = code;
      have_low_nibble = true;
    } else {
      w.put_u8(pending | (code << 4));
      have_low_nibble = false;
    }
  }
  if (have_low_nibble) {
    w.put_u8(pending);
  }
  return w.str();
}

} // namespace ToyBinDASM
