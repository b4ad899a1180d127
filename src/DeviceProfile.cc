#include "DeviceProfile.hh"

#include <algorithm>
#include <format>
#include <stdexcept>

using namespace std;

namespace ToyBinDASM {

static const char* DEFAULT_FORBIDDEN_CHARS = "+-:<>?!~`'\"[]{}\\|@#$%^&*=,";

static vector<uint16_t> index_list(initializer_list<pair<uint16_t, uint16_t>> ranges) {
  vector<uint16_t> ret;
  for (const auto& [first, last] : ranges) {
    for (uint32_t z = first; z <= last; z++) {
      ret.emplace_back(z);
    }
  }
  return ret;
}

static DeviceProfile make_d3_profile() {
  DeviceProfile ret;
  ret.name = "d3";
  ret.name_archive_locations = {"off=0x1EC000/idx=0", "off=0x140000/idx=4/idx=0"};
  ret.npc_string_indexes = index_list({
      {136, 136}, {144, 144}, {151, 151}, {155, 155}, {187, 187}, {302, 311}, {212, 254}});
  ret.stats = StatTableConfig{
      .layout = StatTableLayout::D3_WORD_STREAM,
      .base_offset = 0x0A21CC,
      .record_size = 8,
      .record_count = 155,
      .first_string_index = 2,
      .max_power = 225,
  };
  ret.forbidden_chars = DEFAULT_FORBIDDEN_CHARS;
  ret.max_sprite_index = 2115;
  ret.first_sound_block = 8;
  ret.last_sound_block = 43;
  return ret;
}

static DeviceProfile make_digivice_profile() {
  DeviceProfile ret;
  ret.name = "digivice";
  ret.name_archive_locations = {"off=0x194000/idx=0"};
  ret.npc_string_indexes = index_list({
      {95, 95}, {102, 102}, {106, 106}, {109, 109}, {112, 112}, {115, 115}, {118, 118}, {139, 181}});
  ret.stats = StatTableConfig{
      .layout = StatTableLayout::DIGIVICE_SPLIT_RECORDS,
      .base_offset = 0x97F2A,
      .record_size = 10,
      .record_count = 112,
      .first_string_index = 0,
      .max_power = 225,
  };
  ret.forbidden_chars = DEFAULT_FORBIDDEN_CHARS;
  ret.max_sprite_index = 1578;
  ret.first_sound_block = 8;
  ret.last_sound_block = 40;
  return ret;
}

const DeviceProfile& DeviceProfile::d3() {
  static const DeviceProfile profile = make_d3_profile();
  return profile;
}

const DeviceProfile& DeviceProfile::digivice() {
  static const DeviceProfile profile = make_digivice_profile();
  return profile;
}

const DeviceProfile& DeviceProfile::for_name(const string& name) {
  if (name == "d3") {
    return DeviceProfile::d3();
  } else if (name == "digivice") {
    return DeviceProfile::digivice();
  }
  throw invalid_argument(std::format("unknown device: {} (expected d3 or digivice)", name));
}

bool DeviceProfile::is_name_archive_location(const string& location) const {
  return find(this->name_archive_locations.begin(), this->name_archive_locations.end(), location) !=
      this->name_archive_locations.end();
}

} // namespace ToyBinDASM
