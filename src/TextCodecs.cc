#include "TextCodecs.hh"

#include <format>
#include <phosg/Strings.hh>

using namespace std;

namespace ToyBinDASM {

string format_tag(uint16_t code) {
  return std::format("<{:04X}>", code);
}

string format_tags(const vector<uint16_t>& codes) {
  string ret;
  for (uint16_t code : codes) {
    ret += format_tag(code);
  }
  return ret;
}

static bool is_hex_char(char ch) {
  return ((ch >= '0') && (ch <= '9')) || ((ch >= 'A') && (ch <= 'F')) || ((ch >= 'a') && (ch <= 'f'));
}

vector<uint16_t> parse_tags(const string& s) {
  vector<uint16_t> ret;
  size_t offset = 0;
  while (offset < s.size()) {
    if ((s[offset] != '<') ||
        (offset + 6 > s.size()) ||
        (s[offset + 5] != '>') ||
        !is_hex_char(s[offset + 1]) ||
        !is_hex_char(s[offset + 2]) ||
        !is_hex_char(s[offset + 3]) ||
        !is_hex_char(s[offset + 4])) {
      throw TextEncodeError(std::format(
          "unencodable text at position {}: \"{}\"", offset, s.substr(offset, 10)));
    }
    uint16_t code = 0;
    for (size_t z = 1; z < 5; z++) {
      code = (code << 4) | phosg::value_for_hex_char(s[offset + z]);
    }
    if (code != 0) {
      ret.emplace_back(code);
    }
    offset += 6;
  }
  return ret;
}

string encode_utf8(uint32_t cp) {
  string ret;
  if (cp < 0x80) {
    ret.push_back(cp);
  } else if (cp < 0x800) {
    ret.push_back(0xC0 | (cp >> 6));
    ret.push_back(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    ret.push_back(0xE0 | (cp >> 12));
    ret.push_back(0x80 | ((cp >> 6) & 0x3F));
    ret.push_back(0x80 | (cp & 0x3F));
  } else if (cp < 0x110000) {
    ret.push_back(0xF0 | (cp >> 18));
    ret.push_back(0x80 | ((cp >> 12) & 0x3F));
    ret.push_back(0x80 | ((cp >> 6) & 0x3F));
    ret.push_back(0x80 | (cp & 0x3F));
  } else {
    throw invalid_argument(std::format("invalid code point: {:X}", cp));
  }
  return ret;
}

static size_t utf8_sequence_length(uint8_t lead) {
  if (lead < 0x80) {
    return 1;
  } else if ((lead & 0xE0) == 0xC0) {
    return 2;
  } else if ((lead & 0xF0) == 0xE0) {
    return 3;
  } else if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  // Stray continuation or invalid lead byte; treat it as its own character
  return 1;
}

vector<string> split_utf8_chars(const string& s) {
  vector<string> ret;
  for (size_t offset = 0; offset < s.size();) {
    size_t len = min<size_t>(utf8_sequence_length(s[offset]), s.size() - offset);
    ret.emplace_back(s.substr(offset, len));
    offset += len;
  }
  return ret;
}

size_t utf8_length(const string& s) {
  size_t ret = 0;
  for (size_t offset = 0; offset < s.size(); ret++) {
    offset += utf8_sequence_length(s[offset]);
  }
  return ret;
}

string unescape_unicode(const string& s) {
  string ret;
  for (size_t offset = 0; offset < s.size(); offset++) {
    if ((s[offset] == '\\') && (offset + 1 < s.size())) {
      char next = s[offset + 1];
      if (next == '\\') {
        ret.push_back('\\');
        offset++;
        continue;
      }
      if ((next == 'u') && (offset + 6 <= s.size()) &&
          is_hex_char(s[offset + 2]) && is_hex_char(s[offset + 3]) &&
          is_hex_char(s[offset + 4]) && is_hex_char(s[offset + 5])) {
        uint32_t cp = 0;
        for (size_t z = 2; z < 6; z++) {
          cp = (cp << 4) | phosg::value_for_hex_char(s[offset + z]);
        }
        ret += encode_utf8(cp);
        offset += 5;
        continue;
      }
    }
    ret.push_back(s[offset]);
  }
  return ret;
}

} // namespace ToyBinDASM
