#include "Cli.hh"

#include <phosg/Strings.hh>

#include <algorithm>
#include <format>
#include <set>
#include <stdexcept>

using namespace std;

namespace ToyBinDASM {

size_t parse_cli_number(const string& str) {
  if (str.empty()) {
    throw invalid_argument("Empty number");
  }
  size_t num_chars = 0;
  unsigned long long value;
  try {
    value = stoull(str, &num_chars, 0);
  } catch (const logic_error&) {
    throw invalid_argument(std::format("Illegal number '{}'", str));
  }
  if (num_chars != str.size()) {
    throw invalid_argument(std::format("Illegal number '{}'", str));
  }
  return value;
}

static uint8_t parse_bank(const string& str) {
  size_t bank = parse_cli_number(str);
  if (bank > 15) {
    throw invalid_argument(std::format("Bank {} is out of range (0-15)", bank));
  }
  return bank;
}

vector<uint8_t> parse_cli_banks(const string& str) {
  set<uint8_t> banks;
  for (const string& range : phosg::split(str, ',')) {
    auto tokens = phosg::split(range, '-');
    if (tokens.size() == 1) {
      banks.emplace(parse_bank(tokens[0]));
    } else if (tokens.size() == 2) {
      uint8_t min_bank = parse_bank(tokens[0]);
      uint8_t max_bank = parse_bank(tokens[1]);
      if (min_bank > max_bank) {
        throw invalid_argument(std::format("Empty bank range '{}'", range));
      }
      for (uint8_t bank = min_bank; bank <= max_bank; bank++) {
        banks.emplace(bank);
      }
    } else {
      throw invalid_argument(std::format("Illegal bank range '{}'", range));
    }
  }
  if (banks.empty()) {
    throw invalid_argument(std::format("Empty set of banks '{}'", str));
  }
  return vector<uint8_t>(banks.begin(), banks.end());
}

string sprite_file_name_base(size_t image_index, size_t subimage_index, uint8_t bank) {
  return std::format("{}_{}_{}", image_index, subimage_index, bank);
}

static bool is_decimal(const string& s) {
  return !s.empty() && all_of(s.begin(), s.end(), [](char ch) { return (ch >= '0') && (ch <= '9'); });
}

optional<SpriteFileName> parse_sprite_file_name(const string& filename) {
  size_t slash = filename.rfind('/');
  string name = (slash == string::npos) ? filename : filename.substr(slash + 1);
  size_t dot = name.rfind('.');
  if (dot != string::npos) {
    name.resize(dot);
  }

  auto tokens = phosg::split(name, '_');
  string bank_str;
  if (tokens.size() == 3) {
    bank_str = tokens[2];
  } else if (tokens.size() == 2) {
    auto sub_tokens = phosg::split(tokens[1], '-');
    if (sub_tokens.size() != 2) {
      return nullopt;
    }
    tokens[1] = sub_tokens[0];
    bank_str = sub_tokens[1];
  } else {
    return nullopt;
  }
  if (!is_decimal(tokens[0]) || !is_decimal(tokens[1]) || !is_decimal(bank_str)) {
    return nullopt;
  }

  size_t bank = stoul(bank_str);
  if (bank > 15) {
    return nullopt;
  }
  return SpriteFileName{
      .image_index = stoul(tokens[0]),
      .subimage_index = stoul(tokens[1]),
      .bank = static_cast<uint8_t>(bank),
  };
}

string sound_block_file_name(size_t block_index) {
  return std::format("spf2alp_{:03}.wav", block_index);
}

string a18_chunk_file_name(size_t chunk_index) {
  return std::format("chunk_{:04X}.a18", chunk_index);
}

} // namespace ToyBinDASM
