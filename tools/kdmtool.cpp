#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <kdm/kdm.hpp>

namespace fs = std::filesystem;

namespace {

void printUsage(const char *program) {
  std::cerr << "Usage:\n"
            << "  " << program
            << " extract <data.bin> [-o <manifest_tex.json>] [-c|--clean] [--ext <suffix>]\n"
            << "  " << program << " rebuild <manifest_tex.json> [-o <data.bin>] [--align <n>]\n"
            << "  " << program << " list <data.bin>\n"
            << "\n"
            << "extract  Split <data.bin> and its adjacent <data>_info.bin into a manifest\n"
            << "         and a folder holding one file per entry.\n"
            << "         --clean replaces the contents of a non-empty output folder.\n"
            << "         --ext sets the payload file suffix (default: .bcrez).\n"
            << "rebuild  Lay out the files listed in a manifest into <data.bin> and\n"
            << "         <data>_info.bin. --align overrides the manifest alignment.\n"
            << "list     Print the entries of an archive.\n";
}

struct CommandLine {
  std::string command;
  std::string input;
  std::optional<std::string> output;
  bool clean = false;
  std::string extension = ".bcrez";
  std::optional<uint32_t> alignment;
};

std::optional<uint32_t> parseUint32(std::string_view text) {
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<CommandLine> parseArgs(int argc, char *argv[]) {
  if (argc < 3) {
    return std::nullopt;
  }

  CommandLine cmd;
  cmd.command = argv[1];

  std::vector<std::string_view> positional;
  for (int i = 2; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (++i >= argc) {
        std::cerr << "Error: " << arg << " needs a value\n";
        return std::nullopt;
      }
      cmd.output = argv[i];
    } else if (arg == "-c" || arg == "--clean") {
      cmd.clean = true;
    } else if (arg == "--ext") {
      if (++i >= argc) {
        std::cerr << "Error: --ext needs a value\n";
        return std::nullopt;
      }
      cmd.extension = argv[i];
    } else if (arg == "--align") {
      if (++i >= argc) {
        std::cerr << "Error: --align needs a value\n";
        return std::nullopt;
      }
      cmd.alignment = parseUint32(argv[i]);
      if (!cmd.alignment || !kdm::DataBlockCodec::isValidAlignment(*cmd.alignment)) {
        std::cerr << "Error: --align must be a power of two\n";
        return std::nullopt;
      }
    } else if (!arg.empty() && arg.front() == '-') {
      std::cerr << "Error: unknown option " << arg << "\n";
      return std::nullopt;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() != 1) {
    return std::nullopt;
  }
  cmd.input = positional.front();
  return cmd;
}

int runExtract(const CommandLine &cmd) {
  fs::path input = cmd.input;

  if (cmd.output && !cmd.output->ends_with("_tex.json")) {
    std::cerr << "Warning: output path " << *cmd.output << " does not end with '_tex.json'.\n";
  }

  fs::path manifestPath =
      cmd.output ? fs::path(*cmd.output) : kdm::paths::defaultManifestPath(input);

  kdm::ExtractOptions options;
  options.payloadExtension = cmd.extension;
  options.overwrite = cmd.clean;

  kdm::Error error;
  auto manifest = kdm::ArchiveExtractor::extractFiles(input, manifestPath, options, &error);
  if (!manifest) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  std::cout << "Extracted " << manifest->entries.size() << " entries to "
            << manifest->payloadDirectory << "\n";
  std::cout << "Manifest: " << manifestPath << " (alignment " << manifest->alignment
            << (manifest->padTail ? "" : ", unpadded tail") << ")\n";
  return 0;
}

int runRebuild(const CommandLine &cmd) {
  fs::path input = cmd.input;
  fs::path dataPath = cmd.output ? fs::path(*cmd.output) : kdm::paths::defaultDataPath(input);
  fs::path infoPath = kdm::paths::companionInfoPath(dataPath);

  std::cout << "input folder: " << kdm::paths::payloadDirectoryFor(input) << "\n";
  std::cout << "output file: " << dataPath << "\n";
  std::cout << "secondary output file: " << infoPath << "\n";

  kdm::RebuildOptions options;
  options.alignment = cmd.alignment;

  kdm::Error error;
  if (!kdm::ArchiveBuilder::rebuildFiles(input, dataPath, infoPath, options, &error)) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  return 0;
}

int runList(const CommandLine &cmd) {
  kdm::Error error;
  auto archive = kdm::Archive::open(cmd.input, &error);
  if (!archive) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  std::cout << "Archive: " << cmd.input << "\n";
  std::cout << "Entries: " << archive->entryCount() << "\n\n";

  for (const auto &entry : archive->entries()) {
    std::cout << "  " << entry.name << " (offset " << entry.offset << ", " << entry.size
              << " bytes, flags 0x" << std::hex << entry.flags << std::dec << ")\n";
  }

  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  auto cmd = parseArgs(argc, argv);
  if (!cmd) {
    printUsage(argv[0]);
    return 1;
  }

  if (cmd->command == "extract") {
    return runExtract(*cmd);
  }
  if (cmd->command == "rebuild") {
    return runRebuild(*cmd);
  }
  if (cmd->command == "list") {
    return runList(*cmd);
  }

  std::cerr << "Error: unknown command " << cmd->command << "\n";
  printUsage(argv[0]);
  return 1;
}
