#include "StatTable.hh"

#include <format>
#include <phosg/Strings.hh>
#include <stdexcept>
#include <string>

using namespace std;

namespace ToyBinDASM {

static constexpr size_t D3_WORDS_PER_RECORD = 4;
static constexpr size_t D3_HEAD_WORDS = 4;
static constexpr size_t D3_PARTNER_WORDS = 5;

static size_t d3_word_offset(const StatTableConfig& config, size_t word_index) {
  return config.base_offset + (word_index / D3_WORDS_PER_RECORD) * config.record_size +
      (word_index % D3_WORDS_PER_RECORD) * 2;
}

static vector<uint16_t> read_d3_words(const ByteBuffer& buf, const StatTableConfig& config) {
  vector<uint16_t> ret;
  ret.reserve(config.record_count * D3_WORDS_PER_RECORD);
  for (size_t z = 0; z < config.record_count * D3_WORDS_PER_RECORD; z++) {
    ret.emplace_back(buf.u16l(d3_word_offset(config, z)));
  }
  return ret;
}

static vector<PartnerStats> read_d3_partner_stats(const ByteBuffer& buf, const StatTableConfig& config) {
  auto words = read_d3_words(buf, config);
  vector<PartnerStats> ret;
  if (words.size() < D3_HEAD_WORDS) {
    return ret;
  }

  ret.emplace_back(PartnerStats{
      .slot = 0,
      .string_index = config.first_string_index,
      .stage = words[0],
      .power = words[2],
      .unknown1 = words[1],
      .unknown2 = words[3],
      .offset = d3_word_offset(config, 0),
  });
  size_t num_more = (words.size() - D3_HEAD_WORDS) / D3_PARTNER_WORDS;
  for (size_t z = 0; z < num_more; z++) {
    size_t base = D3_HEAD_WORDS + z * D3_PARTNER_WORDS;
    ret.emplace_back(PartnerStats{
        .slot = z + 1,
        .string_index = words[base],
        .stage = words[base + 1],
        .power = words[base + 3],
        .unknown1 = words[base + 2],
        .unknown2 = words[base + 4],
        .offset = d3_word_offset(config, base),
    });
  }
  return ret;
}

static vector<PartnerStats> read_digivice_partner_stats(const ByteBuffer& buf, const StatTableConfig& config) {
  vector<PartnerStats> ret;
  for (size_t z = 0; z < config.record_count; z++) {
    size_t record_offset = config.base_offset + z * config.record_size;
    size_t next_record_offset = record_offset + config.record_size;
    if (!buf.contains(next_record_offset, config.record_size)) {
      break;
    }
    uint16_t string_index = buf.u16l(record_offset + 4);
    uint16_t power = buf.u16l(next_record_offset);
    if ((string_index == 0) && (power == 0)) {
      break;
    }
    ret.emplace_back(PartnerStats{
        .slot = z,
        .string_index = string_index,
        .stage = 0,
        .power = power,
        .unknown1 = 0,
        .unknown2 = 0,
        .offset = record_offset,
    });
  }
  return ret;
}

vector<PartnerStats> read_partner_stats(const ByteBuffer& buf, const StatTableConfig& config) {
  switch (config.layout) {
    case StatTableLayout::D3_WORD_STREAM:
      return read_d3_partner_stats(buf, config);
    case StatTableLayout::DIGIVICE_SPLIT_RECORDS:
      return read_digivice_partner_stats(buf, config);
  }
  throw logic_error("invalid stat table layout");
}

static PatchSummary write_d3_partner_stats(
    PatchApplier& patcher, const StatTableConfig& config, const vector<PartnerStats>& rows) {
  PatchSummary summary;
  auto existing = read_d3_words(patcher.buffer(), config);

  vector<uint16_t> words;
  for (size_t row_index = 0; row_index < rows.size(); row_index++) {
    const auto& row = rows[row_index];
    if (row_index > 0) {
      words.emplace_back(row.string_index);
    }
    words.emplace_back(row.stage);
    words.emplace_back(row.unknown1);
    size_t power_word_index = words.size();
    if (row.power > config.max_power) {
      summary.skip(std::format("partner {}: power {} exceeds {}; keeping the existing value",
          row_index, row.power, config.max_power));
      phosg::log_warning_f("{}", summary.messages.back());
      words.emplace_back((power_word_index < existing.size()) ? existing[power_word_index] : 0);
    } else {
      words.emplace_back(row.power);
      summary.updated++;
    }
    words.emplace_back(row.unknown2);
  }

  // The table's size is fixed; extra words are dropped and missing words keep
  // their current values
  if (words.size() > existing.size()) {
    summary.messages.emplace_back(std::format("{} words beyond the end of the table were dropped",
        words.size() - existing.size()));
    phosg::log_warning_f("{}", summary.messages.back());
    words.resize(existing.size());
  }
  for (size_t z = words.size(); z < existing.size(); z++) {
    words.emplace_back(existing[z]);
  }

  for (size_t record_index = 0; record_index < config.record_count; record_index++) {
    phosg::StringWriter w;
    for (size_t z = 0; z < D3_WORDS_PER_RECORD; z++) {
      w.put_u16l(words[record_index * D3_WORDS_PER_RECORD + z]);
    }
    PatchResult res = patcher.apply_in_place(d3_word_offset(config, record_index * D3_WORDS_PER_RECORD), w.str());
    if (!patch_succeeded(res)) {
      throw out_of_range(std::format("stat record {} could not be written: {}",
          record_index, name_for_patch_result(res)));
    }
  }
  return summary;
}

static PatchSummary write_digivice_partner_stats(
    PatchApplier& patcher, const StatTableConfig& config, const vector<PartnerStats>& rows) {
  PatchSummary summary;
  for (const auto& row : rows) {
    if (row.slot >= config.record_count) {
      summary.skip(std::format("partner {}: slot is beyond the end of the table", row.slot));
      phosg::log_warning_f("{}", summary.messages.back());
      continue;
    }
    if (row.power > config.max_power) {
      summary.skip(std::format("partner {}: power {} exceeds {}; keeping the existing value",
          row.slot, row.power, config.max_power));
      phosg::log_warning_f("{}", summary.messages.back());
      continue;
    }
    size_t power_offset = config.base_offset + (row.slot + 1) * config.record_size;
    PatchResult res = patcher.apply_u16l(power_offset, row.power);
    summary.add(res);
    if (!patch_succeeded(res)) {
      summary.messages.emplace_back(std::format("partner {}: {}", row.slot, name_for_patch_result(res)));
    }
  }
  return summary;
}

PatchSummary write_partner_stats(PatchApplier& patcher, const StatTableConfig& config, const vector<PartnerStats>& rows) {
  switch (config.layout) {
    case StatTableLayout::D3_WORD_STREAM:
      return write_d3_partner_stats(patcher, config, rows);
    case StatTableLayout::DIGIVICE_SPLIT_RECORDS:
      return write_digivice_partner_stats(patcher, config, rows);
  }
  throw logic_error("invalid stat table layout");
}

} // namespace ToyBinDASM
