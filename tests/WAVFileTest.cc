#include <gtest/gtest.h>

#include <phosg/Filesystem.hh>

#include "Audio/WAVFile.hh"

using namespace std;
using namespace ToyBinDASM::Audio;

static string temp_path(const char* name) {
  return testing::TempDir() + name;
}

TEST(WAVFileTest, Int16Stereo) {
  string filename = temp_path("toybin_wav_stereo.wav");
  vector<int16_t> samples = {0, 1, -1, 32767, -32768, 1234};
  save_wav(filename, samples, 22050, 2);

  auto sound = load_wav(filename);
  EXPECT_EQ(2, sound.num_channels);
  EXPECT_EQ(22050, sound.sample_rate);
  EXPECT_EQ(3, sound.frame_count());
  EXPECT_EQ(samples, sound.samples);
}

TEST(WAVFileTest, FloatAndUnsignedSamples) {
  string filename = temp_path("toybin_wav_float.wav");
  save_wav(filename, vector<float>{0.5f, -1.0f, 2.0f}, 8000, 1);
  auto sound = load_wav(filename);
  EXPECT_EQ(1, sound.num_channels);
  EXPECT_EQ((vector<int16_t>{16383, -32767, 32767}), sound.samples);

  filename = temp_path("toybin_wav_u8.wav");
  save_wav(filename, vector<uint8_t>{0x80, 0xFF, 0x00}, 8000, 1);
  sound = load_wav(filename);
  EXPECT_EQ((vector<int16_t>{0, 0x7F00, -0x8000}), sound.samples);
}

TEST(WAVFileTest, OddFrameIsDropped) {
  string filename = temp_path("toybin_wav_odd.wav");
  save_wav(filename, vector<int16_t>{1, 2, 3}, 8000, 2);
  auto sound = load_wav(filename);
  EXPECT_EQ((vector<int16_t>{1, 2}), sound.samples);
}

TEST(WAVFileTest, RejectsNonWAVData) {
  string filename = temp_path("toybin_wav_bad.wav");
  phosg::save_file(filename, string("JUNKJUNKJUNKJUNKJUNK"));
  EXPECT_THROW(load_wav(filename), runtime_error);
}
