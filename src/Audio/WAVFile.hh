#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#include <phosg/Encoding.hh>
#include <phosg/Filesystem.hh>
#include <string>
#include <type_traits>
#include <vector>

namespace ToyBinDASM {
namespace Audio {

struct RIFFChunkHeader {
  phosg::le_uint32_t magic;
  phosg::le_uint32_t size;
} __attribute__((packed));

struct WAVEFormatChunk {
  phosg::le_uint16_t format; // 1 = PCM, 3 = float
  phosg::le_uint16_t num_channels;
  phosg::le_uint32_t sample_rate;
  phosg::le_uint32_t byte_rate; // num_channels * sample_rate * bits_per_sample / 8
  phosg::le_uint16_t block_align; // num_channels * bits_per_sample / 8
  phosg::le_uint16_t bits_per_sample;
} __attribute__((packed));

// Interleaved 16-bit samples. 8-bit input is widened as (u8 - 128) * 256;
// float input is scaled by 32767 and clipped.
struct SampledSound {
  std::vector<int16_t> samples;
  size_t num_channels = 0;
  size_t sample_rate = 0;

  inline size_t frame_count() const {
    return this->num_channels ? (this->samples.size() / this->num_channels) : 0;
  }
};

SampledSound load_wav(FILE* f);
SampledSound load_wav(const std::string& filename);

struct SaveWAVHeader {
  uint32_t riff_magic = phosg::bswap32(0x52494646); // 'RIFF'
  uint32_t file_size = 0; // RIFF chunk data size (file size - 8)
  uint32_t wave_magic = phosg::bswap32(0x57415645); // 'WAVE'

  uint32_t fmt_magic = phosg::bswap32(0x666d7420); // 'fmt '
  uint32_t fmt_size = 16;
  uint16_t format = 0; // 1 = PCM, 3 = float
  uint16_t num_channels = 0;
  uint32_t sample_rate = 0;
  uint32_t byte_rate = 0;
  uint16_t block_align = 0;
  uint16_t bits_per_sample = 0;

  uint32_t data_magic = phosg::bswap32(0x64617461); // 'data'
  uint32_t data_size = 0;
} __attribute__((packed));

template <typename SampleT>
void save_wav(const std::string& filename, const std::vector<SampleT>& samples, size_t sample_rate, size_t num_channels) {
  SaveWAVHeader header;
  header.file_size = (samples.size() * sizeof(SampleT)) + sizeof(SaveWAVHeader) - 8;
  header.format = std::is_floating_point_v<SampleT> ? 3 : 1;
  header.num_channels = num_channels;
  header.sample_rate = sample_rate;
  header.byte_rate = num_channels * sample_rate * sizeof(SampleT);
  header.block_align = num_channels * sizeof(SampleT);
  header.bits_per_sample = sizeof(SampleT) << 3;
  header.data_size = samples.size() * sizeof(SampleT);

  auto f = phosg::fopen_unique(filename, "wb");
  phosg::fwritex(f.get(), &header, sizeof(SaveWAVHeader));
  phosg::fwritex(f.get(), samples.data(), sizeof(SampleT) * samples.size());
}

} // namespace Audio
} // namespace ToyBinDASM
