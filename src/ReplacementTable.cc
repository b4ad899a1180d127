#include "ReplacementTable.hh"

#include <algorithm>
#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>

#include "TextCodecs.hh"

using namespace std;

namespace ToyBinDASM {

ReplacementTable::ReplacementTable(vector<pair<string, string>>&& rules)
    : rules(std::move(rules)) {
  this->sort_rules();
}

void ReplacementTable::sort_rules() {
  stable_sort(this->rules.begin(), this->rules.end(), [](const auto& a, const auto& b) -> bool {
    return utf8_length(a.first) > utf8_length(b.first);
  });
}

vector<string> parse_csv_row(const string& line) {
  vector<string> ret;
  string field;
  bool in_quotes = false;
  for (size_t z = 0; z < line.size(); z++) {
    char ch = line[z];
    if (in_quotes) {
      if (ch == '\"') {
        if ((z + 1 < line.size()) && (line[z + 1] == '\"')) {
          field.push_back('\"');
          z++;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(ch);
      }
    } else if (ch == '\"') {
      in_quotes = true;
    } else if (ch == ',') {
      ret.emplace_back(std::move(field));
      field.clear();
    } else {
      field.push_back(ch);
    }
  }
  ret.emplace_back(std::move(field));
  return ret;
}

ReplacementTable ReplacementTable::parse_csv(const string& data) {
  // Skip the UTF-8 BOM if present
  size_t start_offset = (data.compare(0, 3, "\xEF\xBB\xBF") == 0) ? 3 : 0;

  vector<pair<string, string>> rules;
  for (string& line : phosg::split(data.substr(start_offset), '\n')) {
    if (!line.empty() && (line.back() == '\r')) {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    auto fields = parse_csv_row(line);
    if (fields.size() < 2 || fields[0].empty()) {
      continue;
    }
    rules.emplace_back(unescape_unicode(fields[0]), unescape_unicode(fields[1]));
  }
  return ReplacementTable(std::move(rules));
}

ReplacementTable ReplacementTable::load_csv(const string& filename) {
  return ReplacementTable::parse_csv(phosg::load_file(filename));
}

string ReplacementTable::apply(const string& s) const {
  string ret = s;
  for (const auto& [source, target] : this->rules) {
    if (source.empty()) {
      continue;
    }
    string replaced;
    size_t offset = 0;
    for (;;) {
      size_t match_offset = ret.find(source, offset);
      if (match_offset == string::npos) {
        break;
      }
      replaced.append(ret, offset, match_offset - offset);
      replaced += target;
      offset = match_offset + source.size();
    }
    if (offset != 0) {
      replaced.append(ret, offset, string::npos);
      ret = std::move(replaced);
    }
  }
  return ret;
}

ReplacementTable ReplacementTable::reversed() const {
  vector<pair<string, string>> swapped;
  swapped.reserve(this->rules.size());
  for (const auto& [source, target] : this->rules) {
    if (!target.empty()) {
      swapped.emplace_back(target, source);
    }
  }
  return ReplacementTable(std::move(swapped));
}

NameCodec::NameCodec(const ReplacementTable& table)
    : forward(table),
      reverse(table.reversed()) {}

string NameCodec::decode(const vector<uint16_t>& codes) const {
  return this->forward.apply(format_tags(codes));
}

string NameCodec::decode(const ByteBuffer& buf, const TextArchive& archive, size_t index) const {
  return this->decode(decode_string_codes(buf, archive, index));
}

vector<uint16_t> NameCodec::encode(const string& display) const {
  return parse_tags(this->reverse.apply(display));
}

} // namespace ToyBinDASM
