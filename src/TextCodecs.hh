#pragma once

#include <stddef.h>
#include <stdint.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace ToyBinDASM {

class TextEncodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Glyph codes at or above this value are markup and are not part of the
// decoded text
constexpr uint16_t FIRST_CONTROL_CODE = 0xF000;

constexpr bool is_control_code(uint16_t code) {
  return code >= FIRST_CONTROL_CODE;
}

// <XXXX> tag form. format_tags emits upper-case hex; parse_tags accepts either
// case and throws TextEncodeError if the string contains anything other than
// tags. <0000> tags are dropped since 0 is the string terminator.
std::string format_tag(uint16_t code);
std::string format_tags(const std::vector<uint16_t>& codes);
std::vector<uint16_t> parse_tags(const std::string& s);

// UTF-8 helpers. Lengths of display names are measured in code points, not
// bytes.
std::string encode_utf8(uint32_t code_point);
std::vector<std::string> split_utf8_chars(const std::string& s);
size_t utf8_length(const std::string& s);

// Decodes \uXXXX (and \\) escapes into UTF-8. Any other backslash sequence is
// left as-is.
std::string unescape_unicode(const std::string& s);

} // namespace ToyBinDASM
