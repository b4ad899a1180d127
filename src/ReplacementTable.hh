#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "ByteBuffer.hh"
#include "TextArchive.hh"

namespace ToyBinDASM {

// An ordered list of literal substitutions between tag form and display text.
// Rules are kept sorted with the longest source first (ties keep their
// original order), and each rule replaces all non-overlapping occurrences
// from left to right before the next rule runs.
class ReplacementTable {
public:
  ReplacementTable() = default;
  explicit ReplacementTable(std::vector<std::pair<std::string, std::string>>&& rules);
  ~ReplacementTable() = default;

  // Reads "source,target" rows. Rows with fewer than two fields or an empty
  // source are ignored; \uXXXX escapes in either field are decoded.
  static ReplacementTable parse_csv(const std::string& data);
  static ReplacementTable load_csv(const std::string& filename);

  std::string apply(const std::string& s) const;
  ReplacementTable reversed() const;

  inline const std::vector<std::pair<std::string, std::string>>& get_rules() const {
    return this->rules;
  }

private:
  void sort_rules();

  std::vector<std::pair<std::string, std::string>> rules;
};

std::vector<std::string> parse_csv_row(const std::string& line);

// Converts between stored strings and display names using a table and its
// reverse
class NameCodec {
public:
  explicit NameCodec(const ReplacementTable& table);
  ~NameCodec() = default;

  std::string decode(const std::vector<uint16_t>& codes) const;
  std::string decode(const ByteBuffer& buf, const TextArchive& archive, size_t index) const;
  // Throws TextEncodeError if the display text doesn't map completely to tags
  std::vector<uint16_t> encode(const std::string& display) const;

private:
  ReplacementTable forward;
  ReplacementTable reverse;
};

} // namespace ToyBinDASM
