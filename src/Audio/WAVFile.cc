#include "WAVFile.hh"

#include <format>
#include <phosg/Filesystem.hh>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

namespace ToyBinDASM {
namespace Audio {

static int16_t float_to_s16(float v) {
  float scaled = v * 32767.0f;
  if (scaled >= 32767.0f) {
    return 32767;
  }
  if (scaled <= -32768.0f) {
    return -32768;
  }
  return static_cast<int16_t>(scaled);
}

static void skip_bytes(FILE* f, size_t size) {
  if (size && fseek(f, size, SEEK_CUR)) {
    throw runtime_error(std::format("cannot skip {} bytes in WAV file", size));
  }
}

SampledSound load_wav(FILE* f) {
  {
    phosg::be_uint32_t magic;
    phosg::freadx(f, &magic, sizeof(uint32_t));
    if (magic != 0x52494646) { // 'RIFF'
      throw runtime_error(std::format("unknown file format: {:08X}", magic.load()));
    }
    phosg::le_uint32_t file_size;
    phosg::freadx(f, &file_size, sizeof(uint32_t));
    phosg::be_uint32_t wave_magic;
    phosg::freadx(f, &wave_magic, sizeof(uint32_t));
    if (wave_magic != 0x57415645) { // 'WAVE'
      throw runtime_error(std::format("sound has incorrect wave_magic ({:08X})", wave_magic.load()));
    }
  }

  SampledSound contents;
  WAVEFormatChunk fmt;
  bool fmt_found = false;
  for (;;) {
    RIFFChunkHeader chunk_header;
    phosg::freadx(f, &chunk_header, sizeof(RIFFChunkHeader));

    if (chunk_header.magic == 0x20746D66) { // 'fmt '
      if (chunk_header.size < sizeof(WAVEFormatChunk)) {
        throw runtime_error(std::format("fmt chunk is too small ({} bytes)", chunk_header.size.load()));
      }
      phosg::freadx(f, &fmt, sizeof(WAVEFormatChunk));
      // Chunks are padded to an even size
      skip_bytes(f, chunk_header.size - sizeof(WAVEFormatChunk) + (chunk_header.size & 1));
      if ((fmt.num_channels < 1) || (fmt.num_channels > 2)) {
        throw runtime_error(std::format("unsupported channel count {}", fmt.num_channels.load()));
      }
      contents.sample_rate = fmt.sample_rate;
      contents.num_channels = fmt.num_channels;
      fmt_found = true;

    } else if (chunk_header.magic == 0x61746164) { // 'data'
      if (!fmt_found) {
        throw runtime_error("data chunk is before fmt chunk");
      }
      if (fmt.bits_per_sample == 0) {
        throw runtime_error("fmt chunk has zero bits per sample");
      }

      size_t num_samples = (8 * chunk_header.size) / fmt.bits_per_sample;
      contents.samples.resize(num_samples);

      // 32-bit float
      if ((fmt.format == 3) && (fmt.bits_per_sample == 32)) {
        vector<float> float_samples(num_samples);
        phosg::freadx(f, float_samples.data(), float_samples.size() * sizeof(float));
        for (size_t x = 0; x < num_samples; x++) {
          contents.samples[x] = float_to_s16(float_samples[x]);
        }

        // 16-bit signed int
      } else if ((fmt.format == 1) && (fmt.bits_per_sample == 16)) {
        vector<phosg::le_int16_t> int_samples(num_samples);
        phosg::freadx(f, int_samples.data(), int_samples.size() * sizeof(int16_t));
        for (size_t x = 0; x < num_samples; x++) {
          contents.samples[x] = int_samples[x];
        }

        // 8-bit unsigned int
      } else if ((fmt.format == 1) && (fmt.bits_per_sample == 8)) {
        vector<uint8_t> int_samples(num_samples);
        phosg::freadx(f, int_samples.data(), int_samples.size());
        for (size_t x = 0; x < num_samples; x++) {
          contents.samples[x] = (static_cast<int16_t>(int_samples[x]) - 0x80) * 0x100;
        }

      } else {
        throw runtime_error(std::format(
            "sample width is not supported (format={}, bits_per_sample={})",
            fmt.format.load(), fmt.bits_per_sample.load()));
      }

      // Drop a trailing partial frame
      contents.samples.resize(contents.frame_count() * contents.num_channels);
      break;

    } else {
      skip_bytes(f, chunk_header.size + (chunk_header.size & 1));
    }
  }

  return contents;
}

SampledSound load_wav(const string& filename) {
  auto f = phosg::fopen_unique(filename, "rb");
  return load_wav(f.get());
}

} // namespace Audio
} // namespace ToyBinDASM
