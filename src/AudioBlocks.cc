#include "AudioBlocks.hh"

#include <math.h>

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

namespace ToyBinDASM {

static const string SPF2ALP_MAGIC("SPF2ALP\0", 8);
const string A18_MARKER("\x00\x00\x80\x3E", 4);

vector<SPF2ALPBlock> scan_spf2alp_blocks(const ByteBuffer& buf) {
  vector<size_t> positions;
  for (size_t pos = buf.find(SPF2ALP_MAGIC); pos != string::npos; pos = buf.find(SPF2ALP_MAGIC, pos + 1)) {
    positions.emplace_back(pos);
  }

  vector<SPF2ALPBlock> ret;
  for (size_t z = 0; z < positions.size(); z++) {
    size_t start = positions[z];
    size_t end = (z + 1 < positions.size()) ? positions[z + 1] : buf.size();
    if (end <= start + SPF2ALP_HEADER_SIZE) {
      continue;
    }
    uint32_t rate = buf.u32l(start + 0x10);
    if ((rate == 0) || (rate > SPF2ALP_MAX_SAMPLE_RATE)) {
      rate = SPF2ALP_DEFAULT_SAMPLE_RATE;
    }
    ret.emplace_back(SPF2ALPBlock{.index = z, .start = start, .end = end, .sample_rate = rate});
  }
  return ret;
}

vector<A18Chunk> scan_a18_chunks(const ByteBuffer& buf) {
  vector<A18Chunk> ret;
  size_t pos = 0;
  for (;;) {
    size_t marker = buf.find(A18_MARKER, pos);
    if (marker == string::npos) {
      break;
    }
    if (marker < 2) {
      pos = marker + 1;
      continue;
    }
    size_t start = marker - 2;
    size_t payload_size = buf.u16l(start);
    if ((payload_size == 0) || (payload_size > A18_MAX_PAYLOAD_SIZE) ||
        !buf.contains(start, A18_CHUNK_HEADER_SIZE + payload_size)) {
      pos = marker + 1;
      continue;
    }
    ret.emplace_back(A18Chunk{.index = ret.size(), .start = start, .payload_size = payload_size});
    pos = marker + 3;
  }
  return ret;
}

optional<string> extract_a18_chunk(const string& raw) {
  // The data may already be exactly one chunk, possibly with a few bytes of
  // trailing padding
  if ((raw.size() >= A18_CHUNK_HEADER_SIZE) && (raw.compare(2, 4, A18_MARKER) == 0)) {
    size_t needed = A18_CHUNK_HEADER_SIZE + phosg::StringReader(raw).pget_u16l(0);
    if ((needed <= raw.size()) && (raw.size() <= needed + 16)) {
      return raw.substr(0, needed);
    }
  }

  // Otherwise, pick the chunk that overruns the end of the data the least
  optional<size_t> best_start;
  int64_t best_overrun = 0;
  for (size_t marker = raw.find(A18_MARKER); marker != string::npos; marker = raw.find(A18_MARKER, marker + 1)) {
    if (marker < 2) {
      continue;
    }
    size_t start = marker - 2;
    size_t payload_size = phosg::StringReader(raw).pget_u16l(start);
    if ((payload_size == 0) || (payload_size > A18_MAX_PAYLOAD_SIZE)) {
      continue;
    }
    int64_t overrun = static_cast<int64_t>(start + A18_CHUNK_HEADER_SIZE + payload_size) - static_cast<int64_t>(raw.size());
    if ((overrun <= 4) && (!best_start || (overrun < best_overrun))) {
      best_start = start;
      best_overrun = overrun;
    }
  }
  if (!best_start) {
    return nullopt;
  }

  string ret = raw.substr(*best_start);
  if (best_overrun > 0) {
    ret.resize(ret.size() + best_overrun, '\0');
  }
  return ret;
}

static vector<int16_t> mix_to_mono(const Audio::SampledSound& sound) {
  if (sound.num_channels == 1) {
    return sound.samples;
  }
  if (sound.num_channels != 2) {
    throw CodecFailure(std::format("unsupported channel count {}", sound.num_channels));
  }
  vector<int16_t> ret;
  ret.reserve(sound.frame_count());
  for (size_t z = 0; z + 1 < sound.samples.size(); z += 2) {
    // Truncates toward zero
    ret.emplace_back(static_cast<int16_t>((static_cast<double>(sound.samples[z]) + sound.samples[z + 1]) / 2.0));
  }
  return ret;
}

static vector<int16_t> resample_linear(const vector<int16_t>& pcm, size_t src_rate, size_t dest_rate) {
  if (src_rate == 0) {
    throw CodecFailure("source sample rate is zero");
  }
  double duration = static_cast<double>(pcm.size()) / src_rate;
  int64_t new_size = llround(duration * dest_rate);
  if (new_size <= 0) {
    throw CodecFailure("resampled sound is empty");
  }

  vector<int16_t> ret;
  ret.reserve(new_size);
  for (int64_t z = 0; z < new_size; z++) {
    double pos = static_cast<double>(z) * pcm.size() / new_size;
    size_t left = static_cast<size_t>(pos);
    double v;
    if (left + 1 >= pcm.size()) {
      v = pcm.back();
    } else {
      double frac = pos - left;
      v = pcm[left] + (pcm[left + 1] - pcm[left]) * frac;
    }
    ret.emplace_back(static_cast<int16_t>(v));
  }
  return ret;
}

vector<int16_t> condition_pcm(const Audio::SampledSound& sound, uint32_t target_rate, const PcmConditioning& options) {
  vector<int16_t> pcm = mix_to_mono(sound);
  if (pcm.empty()) {
    throw CodecFailure("sound contains no samples");
  }
  if (sound.sample_rate != target_rate) {
    pcm = resample_linear(pcm, sound.sample_rate, target_rate);
  }

  vector<double> samples(pcm.begin(), pcm.end());

  double sum_squares = 0.0;
  for (double v : samples) {
    sum_squares += v * v;
  }
  double rms = sqrt(sum_squares / samples.size());
  if (rms > 0.0) {
    double gain = (pow(10.0, options.target_rms_dbfs / 20.0) * 32767.0) / rms;
    for (double& v : samples) {
      v *= gain;
    }
  }

  double peak = 0.0;
  for (double v : samples) {
    peak = max(peak, fabs(v));
  }
  double peak_limit = options.limit_ceiling * 32767.0;
  if (peak > peak_limit) {
    double gain = peak_limit / peak;
    for (double& v : samples) {
      v *= gain;
    }
  }

  vector<int16_t> ret;
  ret.reserve(samples.size());
  for (double v : samples) {
    ret.emplace_back(static_cast<int16_t>(min(max(v, -32768.0), 32767.0)));
  }
  return ret;
}

vector<int16_t> decode_spf2alp_block(const ByteBuffer& buf, const SPF2ALPBlock& block, const AdpcmConfig& config) {
  return decode_gp_adpcm(buf.read(block.payload_offset(), block.slot_size()), config);
}

PatchResult import_spf2alp_payload(
    PatchApplier& patcher, const SPF2ALPBlock& block, const vector<int16_t>& pcm, const AdpcmConfig& config) {
  string encoded = encode_gp_adpcm(pcm, config);
  if (encoded.empty()) {
    throw CodecFailure(std::format("block {:03} encoded to nothing", block.index));
  }
  return patcher.apply_fitted(
      block.payload_offset(), encoded, block.slot_size(), FitPolicy::PAD_OR_TRUNCATE, 0x00);
}

PatchResult import_a18_chunk(PatchApplier& patcher, const A18Chunk& slot, const string& chunk) {
  if ((chunk.size() < A18_CHUNK_HEADER_SIZE) || (chunk.compare(2, 4, A18_MARKER) != 0)) {
    throw CodecFailure("replacement is not an A18 chunk");
  }
  size_t declared_size = phosg::StringReader(chunk).pget_u16l(0);
  string payload = chunk.substr(A18_CHUNK_HEADER_SIZE, declared_size);

  bool truncated = false;
  if (payload.size() > slot.payload_size) {
    payload.resize(slot.payload_size);
    truncated = true;
  }

  phosg::StringWriter w;
  w.put_u16l(payload.size());
  w.write(A18_MARKER);
  w.write(payload);

  PatchResult res = patcher.apply_fitted(slot.start, w.str(), slot.slot_size(), FitPolicy::PAD, 0x00);
  if (truncated && patch_succeeded(res)) {
    return PatchResult::TRUNCATED;
  }
  return res;
}

} // namespace ToyBinDASM
