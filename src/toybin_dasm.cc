#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

#include <algorithm>
#include <format>
#include <map>
#include <memory>
#include <phosg/Arguments.hh>
#include <phosg/Filesystem.hh>
#include <phosg/Image.hh>
#include <phosg/Strings.hh>
#include <string>
#include <tuple>
#include <vector>

#include "ArchiveScanner.hh"
#include "Audio/WAVFile.hh"
#include "AudioBlocks.hh"
#include "ByteBuffer.hh"
#include "Cli.hh"
#include "DeviceProfile.hh"
#include "ImageSaver.hh"
#include "NameTable.hh"
#include "NameUpdate.hh"
#include "Palette.hh"
#include "PatchApplier.hh"
#include "ReplacementTable.hh"
#include "SpriteCompositor.hh"
#include "SpritePackage.hh"
#include "StatTable.hh"
#include "TextArchive.hh"

using namespace std;
using namespace ToyBinDASM;

static void print_usage() {
  phosg::fwrite_fmt(stderr, "\
Usage: toybin_dasm COMMAND BIN-FILE [options]\n\
\n\
Inspects and edits ROM images of the D-3 and Digivice toys. Every edit is\n\
made in place: the output file always has the same size as the input.\n\
\n\
Commands:\n\
  list-archives BIN\n\
      List every archive found in the file, with its location key.\n\
  list-text-archives BIN\n\
      List every text archive found in the file.\n\
  export-names BIN --replace-map=CSV [--npc-only]\n\
      Print the character names as INDEX<TAB>NAME lines. With --npc-only,\n\
      print the NPC names as LOCATION<TAB>INDEX<TAB>NAME lines instead.\n\
  import-names BIN NAMES-FILE --replace-map=CSV --out=OUT\n\
      Apply names from a file in either of the formats above.\n\
  export-stats BIN --replace-map=CSV\n\
      Print the partner stat table.\n\
  import-stats BIN STATS-FILE --out=OUT [--replace-map=CSV]\n\
      Apply a stat table in the format printed by export-stats. If\n\
      --replace-map is given, the names in the file are applied too.\n\
  export-sprites BIN --out-dir=DIR\n\
      Compose sprites into images named INDEX_SUBIMAGE_BANK.png.\n\
  replace-sprites BIN --input-dir=DIR --out=OUT\n\
      Write edited images back into the sprites' pixel data.\n\
  update-palette BIN --input-dir=DIR --out=OUT\n\
      Build palette banks from the colors of edited images.\n\
  export-sounds BIN --out-dir=DIR\n\
      Decode SPF2ALP sound blocks to spf2alp_NNN.wav files.\n\
  import-sounds BIN --input-dir=DIR --out=OUT\n\
      Encode spf2alp_NNN.wav files back into their sound blocks.\n\
  export-a18 BIN --out-dir=DIR\n\
      Save A18 chunks as chunk_XXXX.a18 files.\n\
  import-a18 BIN --input-dir=DIR --out=OUT\n\
      Write chunk_XXXX.a18 files back over their chunks.\n\
\n\
General options:\n\
  --device=d3|digivice: Select the device family (default d3).\n\
  --dry-run: Validate every edit but don\'t write the output file.\n\
\n\
Name options:\n\
  --name-policy=exact: Only accept names whose encoding is exactly as long as\n\
      the existing string\'s slot (default).\n\
  --name-policy=pad: Refuse names longer than the existing name; pad shorter\n\
      names with underscores.\n\
  --overflow=reject|truncate: With --name-policy=pad, what to do when the\n\
      encoding is still too large for the slot (default reject).\n\
\n\
Sprite options:\n\
  --package-offset=OFFSET: Use the sprite package at this offset instead of\n\
      searching for it.\n\
  --start=N, --end=N: Range of image indexes to export (end is exclusive).\n\
  --banks=LIST: Palette banks to export, e.g. 0-15 or 0,1,2 (default 0-15).\n\
  --alpha=auto|normal|inverted: Meaning of the color alpha bit (default auto;\n\
      update-palette defaults to inverted).\n\
  --palette-step=colors|4: Palette entries between banks (default colors).\n\
  --use-attr-palette: Use each sprite\'s own palette bank.\n\
  --set-sprite-bank: With update-palette, switch the subimage\'s sprites to\n\
      the bank from the file name.\n\
  --auto-bank: With update-palette, write to the first bank not used by any\n\
      image sharing the palette instead of the bank from the file name.\n\
\n\
Sound options:\n\
  --start=N, --end=N: Range of SPF2ALP block indexes to export (inclusive;\n\
      defaults depend on the device).\n\
\n" IMAGE_SAVER_HELP);
}

static ByteBuffer load_bin(const phosg::Arguments& args) {
  string filename = args.get<string>(1, true);
  auto buf = ByteBuffer::load(filename);
  phosg::log_info_f("Loaded {} (0x{:X} bytes)", filename, buf.size());
  return buf;
}

static void finish_edit(const phosg::Arguments& args, const ByteBuffer& buf, const PatchSummary& summary, bool dry_run) {
  phosg::fwrite_fmt(stderr, "{}\n", summary.str());
  if (dry_run) {
    phosg::fwrite_fmt(stderr, "Dry run; no output written\n");
    return;
  }
  string out_filename = args.get<string>("out", true);
  buf.save(out_filename);
  phosg::fwrite_fmt(stderr, "Output written to {}\n", out_filename);
}

static vector<string> read_table_lines(const string& filename) {
  vector<string> ret;
  for (auto& line : phosg::split(phosg::load_file(filename), '\n')) {
    if (!line.empty() && (line.back() == '\r')) {
      line.pop_back();
    }
    if (line.empty() || (line[0] == '#')) {
      continue;
    }
    ret.emplace_back(std::move(line));
  }
  return ret;
}

static void mkdirx(const string& path, mode_t mode) {
  if (mkdir(path.c_str(), mode) && (errno != EEXIST)) {
    throw runtime_error(std::format("cannot create directory {} ({})", path, errno));
  }
}

static unique_ptr<NameUpdateStrategy> make_name_strategy(
    const phosg::Arguments& args, const NameCodec& codec, const DeviceProfile& profile) {
  string policy = args.get<string>("name-policy", false);
  if (policy.empty() || (policy == "exact")) {
    return make_unique<ExactByteLengthStrategy>(codec, profile.forbidden_chars);
  } else if (policy == "pad") {
    string overflow = args.get<string>("overflow", false);
    return make_unique<PadToDisplayLengthStrategy>(codec, profile.forbidden_chars, "_",
        overflow.empty() ? OverflowPolicy::REJECT : parse_overflow_policy(overflow));
  }
  throw invalid_argument(std::format("unknown name policy: {}", policy));
}

static void command_list_archives(const phosg::Arguments& args, const DeviceProfile& profile) {
  auto buf = load_bin(args);
  for (const auto& located : scan_archives(buf, profile.archive_config)) {
    phosg::fwrite_fmt(stdout, "{}\t0x{:X}\tdepth={}\tentries={}\n",
        located.location, located.archive.base_offset, located.depth, located.archive.entries.size());
  }
}

static void command_list_text_archives(const phosg::Arguments& args, const DeviceProfile& profile) {
  auto buf = load_bin(args);
  for (const auto& located : scan_archives(buf, profile.archive_config)) {
    for (const auto& text : find_text_archives(buf, located)) {
      phosg::fwrite_fmt(stdout, "{}\t0x{:X}\tstrings={}{}\n",
          text.location, text.base_offset, text.string_count(),
          profile.is_name_archive_location(text.location) ? "\t(names)" : "");
    }
  }
}

static void command_export_names(const phosg::Arguments& args, const DeviceProfile& profile) {
  auto buf = load_bin(args);
  NameCodec codec(ReplacementTable::load_csv(args.get<string>("replace-map", true)));
  auto table = NameTable::open(buf, profile, codec);

  if (args.get<bool>("npc-only")) {
    for (const auto& ref : table.select(profile.npc_string_indexes)) {
      phosg::fwrite_fmt(stdout, "{}\t{}\t{}\n",
          ref.archive->location, ref.index, table.decode_name(buf, ref.archive->location, ref.index));
    }
  } else {
    for (size_t z = 0; z < table.size(); z++) {
      phosg::fwrite_fmt(stdout, "{}\t{}\n", z, table.decode_name(buf, z));
    }
  }
}

static void command_import_names(const phosg::Arguments& args, const DeviceProfile& profile) {
  bool dry_run = args.get<bool>("dry-run");
  auto buf = load_bin(args);
  auto lines = read_table_lines(args.get<string>(2, true));
  NameCodec codec(ReplacementTable::load_csv(args.get<string>("replace-map", true)));
  auto table = NameTable::open(buf, profile, codec);
  auto strategy = make_name_strategy(args, codec, profile);

  PatchApplier patcher(buf, dry_run);
  PatchSummary summary;
  for (const auto& line : lines) {
    auto fields = phosg::split(line, '\t');
    NameUpdateResult res;
    if (fields.size() == 2) {
      res = table.update_name(patcher, parse_cli_number(fields[0]), fields[1], *strategy);
    } else if (fields.size() == 3) {
      res = table.update_name(patcher, fields[0], parse_cli_number(fields[1]), fields[2], *strategy);
    } else {
      summary.skip(std::format("malformed line: {}", line));
      phosg::log_warning_f("Malformed line: {}", line);
      continue;
    }
    add_to_summary(summary, res, line);
  }
  finish_edit(args, buf, summary, dry_run);
}

static void command_export_stats(const phosg::Arguments& args, const DeviceProfile& profile) {
  auto buf = load_bin(args);
  NameCodec codec(ReplacementTable::load_csv(args.get<string>("replace-map", true)));
  auto table = NameTable::open(buf, profile, codec);

  phosg::fwrite_fmt(stdout, "# slot\tstring_index\tname\tstage\tpower\tunknown1\tunknown2\n");
  for (const auto& row : read_partner_stats(buf, profile.stats)) {
    string name = (row.string_index < table.size())
        ? table.decode_name(buf, row.string_index)
        : std::format("(string_index={})", row.string_index);
    phosg::fwrite_fmt(stdout, "{}\t{}\t{}\t{}\t{}\t{}\t{}\n",
        row.slot, row.string_index, name, row.stage, row.power, row.unknown1, row.unknown2);
  }
}

static void command_import_stats(const phosg::Arguments& args, const DeviceProfile& profile) {
  bool dry_run = args.get<bool>("dry-run");
  auto buf = load_bin(args);

  vector<PartnerStats> rows;
  vector<pair<uint16_t, string>> names;
  for (const auto& line : read_table_lines(args.get<string>(2, true))) {
    auto fields = phosg::split(line, '\t');
    if (fields.size() != 7) {
      throw runtime_error(std::format("malformed stats line: {}", line));
    }
    auto& row = rows.emplace_back();
    row.slot = parse_cli_number(fields[0]);
    row.string_index = parse_cli_number(fields[1]);
    row.stage = parse_cli_number(fields[3]);
    row.power = parse_cli_number(fields[4]);
    row.unknown1 = parse_cli_number(fields[5]);
    row.unknown2 = parse_cli_number(fields[6]);
    row.offset = 0;
    names.emplace_back(row.string_index, fields[2]);
  }

  PatchApplier patcher(buf, dry_run);
  PatchSummary summary = write_partner_stats(patcher, profile.stats, rows);

  string replace_map_filename = args.get<string>("replace-map", false);
  if (!replace_map_filename.empty()) {
    NameCodec codec(ReplacementTable::load_csv(replace_map_filename));
    auto table = NameTable::open(buf, profile, codec);
    auto strategy = make_name_strategy(args, codec, profile);
    for (const auto& [string_index, name] : names) {
      if (name.starts_with("(string_index=")) {
        continue;
      }
      auto res = table.update_name(patcher, string_index, name, *strategy);
      add_to_summary(summary, res, std::format("name {}", string_index));
    }
  }
  finish_edit(args, buf, summary, dry_run);
}

struct SpriteOptions {
  ComposeOptions compose;
  optional<size_t> package_offset;
};

static SpriteOptions parse_sprite_options(const phosg::Arguments& args, AlphaMode default_alpha) {
  SpriteOptions ret;
  string alpha = args.get<string>("alpha", false);
  ret.compose.alpha_mode = alpha.empty() ? default_alpha : parse_alpha_mode(alpha);
  string step = args.get<string>("palette-step", false);
  if (!step.empty()) {
    ret.compose.palette_step = parse_palette_step(step);
  }
  ret.compose.use_attribute_bank = args.get<bool>("use-attr-palette");
  string package_offset = args.get<string>("package-offset", false);
  if (!package_offset.empty()) {
    ret.package_offset = parse_cli_number(package_offset);
  }
  return ret;
}

static SpritePackage open_sprite_package(
    const ByteBuffer& buf, const SpriteOptions& options, const SpritePackageLocatorConfig& config) {
  if (options.package_offset) {
    return parse_sprite_package(buf, *options.package_offset);
  }
  return locate_sprite_package(buf, config);
}

struct SpriteImageFile {
  string path;
  SpriteFileName name;
};

static vector<SpriteImageFile> collect_sprite_image_files(const string& dir) {
  vector<SpriteImageFile> ret;
  for (const auto& filename : phosg::list_directory(dir)) {
    if (!filename.ends_with(".png") && !filename.ends_with(".PNG")) {
      continue;
    }
    auto name = parse_sprite_file_name(filename);
    if (name) {
      ret.emplace_back(SpriteImageFile{dir + "/" + filename, *name});
    }
  }
  sort(ret.begin(), ret.end(), [](const SpriteImageFile& a, const SpriteImageFile& b) {
    return make_tuple(a.name.image_index, a.name.subimage_index, a.name.bank, a.path) <
        make_tuple(b.name.image_index, b.name.subimage_index, b.name.bank, b.path);
  });
  if (ret.empty()) {
    throw runtime_error(std::format("no files named INDEX_SUBIMAGE_BANK.png in {}", dir));
  }
  return ret;
}

static void command_export_sprites(const phosg::Arguments& args, const DeviceProfile& profile) {
  auto buf = load_bin(args);
  auto options = parse_sprite_options(args, AlphaMode::AUTO);
  // Exporting accepts a wider image count window than the editing flows
  SpritePackageLocatorConfig locator_config;
  locator_config.min_images = 500;
  locator_config.max_images = 10000;
  locator_config.tie_break = PackageTieBreak::FIRST_MATCH;
  auto pkg = open_sprite_package(buf, options, locator_config);

  string banks_str = args.get<string>("banks", false);
  auto banks = parse_cli_banks(banks_str.empty() ? "0-15" : banks_str);
  size_t start = args.get<size_t>("start", 0);
  size_t end = min<size_t>(args.get<size_t>("end", profile.max_sprite_index + 1), pkg.images.size());

  ImageSaver image_saver;
  string image_format = args.get<string>(IMAGE_SAVER_OPTION, false);
  if (!image_format.empty()) {
    image_saver.set_format(image_format);
  }
  string out_dir = args.get<string>("out-dir", true);
  mkdirx(out_dir, 0777);

  size_t num_saved = 0;
  for (size_t image_index = start; image_index < end; image_index++) {
    size_t num_subimages = pkg.subimage_count(image_index);
    for (size_t sub = 0; sub < num_subimages; sub++) {
      for (uint8_t bank : banks) {
        auto img = compose_subimage(buf, pkg, image_index, sub, bank, options.compose);
        if (!img) {
          continue;
        }
        string filename = image_saver.save_image(*img, out_dir + "/" + sprite_file_name_base(image_index, sub, bank));
        phosg::log_info_f("... {}", filename);
        num_saved++;
      }
    }
  }
  phosg::fwrite_fmt(stderr, "{} images exported to {}\n", num_saved, out_dir);
}

static void command_replace_sprites(const phosg::Arguments& args, const DeviceProfile& profile) {
  bool dry_run = args.get<bool>("dry-run");
  auto buf = load_bin(args);
  auto options = parse_sprite_options(args, AlphaMode::AUTO);
  auto files = collect_sprite_image_files(args.get<string>("input-dir", true));
  auto pkg = open_sprite_package(buf, options, profile.sprite_locator);

  PatchApplier patcher(buf, dry_run);
  PatchSummary summary;
  for (const auto& file : files) {
    try {
      auto img = load_png(file.path);
      size_t num_tiles = replace_subimage(
          patcher, pkg, file.name.image_index, file.name.subimage_index, file.name.bank, img, options.compose);
      phosg::log_info_f("{}: {} tiles written", file.path, num_tiles);
      summary.updated++;
    } catch (const invalid_argument& e) {
      summary.skip(std::format("{}: {}", file.path, e.what()));
      phosg::log_warning_f("{}", summary.messages.back());
    } catch (const out_of_range& e) {
      summary.skip(std::format("{}: {}", file.path, e.what()));
      phosg::log_warning_f("{}", summary.messages.back());
    } catch (const runtime_error& e) {
      summary.skip(std::format("{}: {}", file.path, e.what()));
      phosg::log_warning_f("{}", summary.messages.back());
    }
  }
  finish_edit(args, buf, summary, dry_run);
}

static void command_update_palette(const phosg::Arguments& args, const DeviceProfile& profile) {
  bool dry_run = args.get<bool>("dry-run");
  bool set_sprite_bank = args.get<bool>("set-sprite-bank");
  bool auto_bank = args.get<bool>("auto-bank");
  auto buf = load_bin(args);
  auto options = parse_sprite_options(args, AlphaMode::INVERTED);
  auto files = collect_sprite_image_files(args.get<string>("input-dir", true));
  auto pkg = open_sprite_package(buf, options, profile.sprite_locator);

  PatchApplier patcher(buf, dry_run);
  PatchSummary summary;
  for (const auto& file : files) {
    try {
      const auto& image = pkg.images.at(file.name.image_index);
      uint8_t bank = auto_bank ? pkg.choose_free_bank(image.palette_start_index) : file.name.bank;
      AlphaPolarity polarity;
      if (options.compose.alpha_mode == AlphaMode::AUTO) {
        auto layout = compute_subimage_layout(pkg, file.name.image_index, file.name.subimage_index);
        if (!layout) {
          throw out_of_range("subimage has no tiles");
        }
        polarity = alpha_polarity_for_subimage(pkg, file.name.image_index, *layout, options.compose);
      } else {
        polarity = (options.compose.alpha_mode == AlphaMode::INVERTED) ? AlphaPolarity::INVERTED : AlphaPolarity::NORMAL;
      }

      auto img = load_png(file.path);
      size_t num_colors = update_palette_from_image(
          patcher, pkg, file.name.image_index, file.name.subimage_index, bank, img, polarity, set_sprite_bank);
      phosg::log_info_f("{}: {} colors written to bank {}", file.path, num_colors, bank);
      summary.updated++;
    } catch (const invalid_argument& e) {
      summary.skip(std::format("{}: {}", file.path, e.what()));
      phosg::log_warning_f("{}", summary.messages.back());
    } catch (const out_of_range& e) {
      summary.skip(std::format("{}: {}", file.path, e.what()));
      phosg::log_warning_f("{}", summary.messages.back());
    } catch (const runtime_error& e) {
      summary.skip(std::format("{}: {}", file.path, e.what()));
      phosg::log_warning_f("{}", summary.messages.back());
    }
  }
  finish_edit(args, buf, summary, dry_run);
}

static void command_export_sounds(const phosg::Arguments& args, const DeviceProfile& profile) {
  auto buf = load_bin(args);
  size_t start = args.get<size_t>("start", profile.first_sound_block);
  size_t end = args.get<size_t>("end", profile.last_sound_block);
  string out_dir = args.get<string>("out-dir", true);
  mkdirx(out_dir, 0777);

  auto blocks = scan_spf2alp_blocks(buf);
  phosg::fwrite_fmt(stderr, "{} SPF2ALP blocks found\n", blocks.size());
  for (const auto& block : blocks) {
    if ((block.index < start) || (block.index > end)) {
      continue;
    }
    auto pcm = decode_spf2alp_block(buf, block, profile.adpcm);
    string filename = out_dir + "/" + sound_block_file_name(block.index);
    Audio::save_wav(filename, pcm, block.sample_rate, 1);
    phosg::log_info_f("Block {:03} at 0x{:X} ({} Hz, {} samples) -> {}",
        block.index, block.start, block.sample_rate, pcm.size(), filename);
  }
}

static void command_import_sounds(const phosg::Arguments& args, const DeviceProfile& profile) {
  bool dry_run = args.get<bool>("dry-run");
  auto buf = load_bin(args);
  string input_dir = args.get<string>("input-dir", true);

  PatchApplier patcher(buf, dry_run);
  PatchSummary summary;
  for (const auto& block : scan_spf2alp_blocks(buf)) {
    string filename = input_dir + "/" + sound_block_file_name(block.index);
    if (!phosg::isfile(filename)) {
      continue;
    }
    try {
      auto pcm = condition_pcm(Audio::load_wav(filename), block.sample_rate);
      auto res = import_spf2alp_payload(patcher, block, pcm, profile.adpcm);
      summary.add(res);
      phosg::log_info_f("Block {:03}: {} ({} samples at {} Hz into {} bytes)",
          block.index, name_for_patch_result(res), pcm.size(), block.sample_rate, block.slot_size());
    } catch (const runtime_error& e) {
      // Includes CodecFailure and unreadable WAV files
      summary.skip(std::format("block {:03}: {}", block.index, e.what()));
      phosg::log_warning_f("{}", summary.messages.back());
    }
  }
  finish_edit(args, buf, summary, dry_run);
}

static void command_export_a18(const phosg::Arguments& args, const DeviceProfile&) {
  auto buf = load_bin(args);
  string out_dir = args.get<string>("out-dir", true);
  mkdirx(out_dir, 0777);

  auto chunks = scan_a18_chunks(buf);
  for (const auto& chunk : chunks) {
    string filename = out_dir + "/" + a18_chunk_file_name(chunk.index);
    phosg::save_file(filename, buf.read(chunk.start, chunk.slot_size()));
    phosg::log_info_f("Chunk {:04X} at 0x{:06X} (0x{:X} bytes) -> {}",
        chunk.index, chunk.start, chunk.payload_size, filename);
  }
  phosg::fwrite_fmt(stderr, "{} A18 chunks exported (sample rate {} Hz)\n", chunks.size(), A18_DEFAULT_SAMPLE_RATE);
}

static void command_import_a18(const phosg::Arguments& args, const DeviceProfile&) {
  bool dry_run = args.get<bool>("dry-run");
  auto buf = load_bin(args);
  string input_dir = args.get<string>("input-dir", true);

  PatchApplier patcher(buf, dry_run);
  PatchSummary summary;
  for (const auto& chunk : scan_a18_chunks(buf)) {
    string filename = input_dir + "/" + a18_chunk_file_name(chunk.index);
    if (!phosg::isfile(filename)) {
      continue;
    }
    try {
      auto extracted = extract_a18_chunk(phosg::load_file(filename));
      if (!extracted) {
        throw CodecFailure("no A18 chunk in file");
      }
      auto res = import_a18_chunk(patcher, chunk, *extracted);
      summary.add(res);
      phosg::log_info_f("Chunk {:04X}: {}", chunk.index, name_for_patch_result(res));
    } catch (const runtime_error& e) {
      summary.skip(std::format("chunk {:04X}: {}", chunk.index, e.what()));
      phosg::log_warning_f("{}", summary.messages.back());
    }
  }
  finish_edit(args, buf, summary, dry_run);
}

using CommandFn = void (*)(const phosg::Arguments&, const DeviceProfile&);

static const map<string, CommandFn> commands = {
    {"list-archives", command_list_archives},
    {"list-text-archives", command_list_text_archives},
    {"export-names", command_export_names},
    {"import-names", command_import_names},
    {"export-stats", command_export_stats},
    {"import-stats", command_import_stats},
    {"export-sprites", command_export_sprites},
    {"replace-sprites", command_replace_sprites},
    {"update-palette", command_update_palette},
    {"export-sounds", command_export_sounds},
    {"import-sounds", command_import_sounds},
    {"export-a18", command_export_a18},
    {"import-a18", command_import_a18},
};

int main(int argc, char* argv[]) {
  phosg::Arguments args(&argv[1], argc - 1);

  if (args.get<bool>("help") || argc <= 2) {
    print_usage();
    return (argc <= 2) ? 1 : 0;
  }

  string command_name = args.get<string>(0, true);
  auto command_it = commands.find(command_name);
  if (command_it == commands.end()) {
    phosg::fwrite_fmt(stderr, "Unknown command: {}\n", command_name);
    print_usage();
    return 1;
  }

  try {
    string device_name = args.get<string>("device", false);
    const auto& profile = DeviceProfile::for_name(device_name.empty() ? "d3" : device_name);
    command_it->second(args, profile);
  } catch (const exception& e) {
    phosg::log_error_f("{}", e.what());
    return 2;
  }
  return 0;
}
