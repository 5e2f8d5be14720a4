#include <format>
#include <system_error>

#include <kdm/archive.hpp>
#include <kdm/data_block.hpp>
#include <kdm/info_codec.hpp>
#include <kdm/paths.hpp>

#include "file_io.hpp"

namespace kdm {

namespace {

// Refuse to mix a new extraction with files from an earlier one unless asked to replace them
bool preparePayloadDirectory(const std::filesystem::path &payloadDir, bool overwrite,
                             Error *outError) {
  std::error_code ec;
  if (!std::filesystem::is_directory(payloadDir, ec)) {
    return true;
  }

  const bool isEmpty = std::filesystem::is_empty(payloadDir, ec);
  if (ec) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to inspect {}: {}", payloadDir.string(), ec.message()));
  }
  if (isEmpty) {
    return true;
  }

  if (!overwrite) {
    return detail::fail(
        outError, ErrorCode::OutputNotEmpty,
        std::format("The output directory {} contains items; enable overwrite to replace them",
                    payloadDir.string()));
  }

  std::filesystem::remove_all(payloadDir, ec);
  if (ec) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to clear {}: {}", payloadDir.string(), ec.message()));
  }
  return true;
}

std::filesystem::path stagingPath(const std::filesystem::path &target) {
  auto staged = target;
  staged += ".partial";
  return staged;
}

// Only staged regular files are removed; anything else at that path was not ours
void discard(const std::filesystem::path &staged) noexcept {
  std::error_code ec;
  if (std::filesystem::is_regular_file(staged, ec)) {
    std::filesystem::remove(staged, ec);
  }
}

bool commit(const std::filesystem::path &staged, const std::filesystem::path &target,
            Error *outError) {
  std::error_code ec;
  std::filesystem::rename(staged, target, ec);
  if (ec) {
    discard(staged);
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to move {} into place: {}", target.string(),
                                    ec.message()));
  }
  return true;
}

} // namespace

std::optional<Archive> Archive::open(const std::filesystem::path &dataPath, Error *outError) {
  Archive archive;
  if (!archive.dataFile_.openRead(dataPath, outError)) {
    return std::nullopt;
  }

  // The info file is only needed while parsing
  MappedFile infoFile;
  if (!infoFile.openRead(paths::companionInfoPath(dataPath), outError)) {
    return std::nullopt;
  }

  auto table = InfoCodec::parse(infoFile.data(), outError);
  if (!table) {
    return std::nullopt;
  }

  if (!table->validate(archive.dataFile_.size(), outError)) {
    return std::nullopt;
  }

  archive.table_ = std::move(*table);
  return archive;
}

std::span<const uint8_t> Archive::payload(const Entry &entry) const {
  auto archiveData = dataFile_.data();

  // Validate bounds
  if (static_cast<uint64_t>(entry.offset) + entry.size > archiveData.size()) {
    return {};
  }

  return archiveData.subspan(entry.offset, entry.size);
}

std::optional<std::vector<uint8_t>> Archive::payloadCopy(const Entry &entry,
                                                         Error *outError) const {
  if (static_cast<uint64_t>(entry.offset) + entry.size > dataFile_.size()) {
    detail::fail(outError, ErrorCode::OutOfBounds,
                 std::format("Invalid payload bounds for: {}", entry.name));
    return std::nullopt;
  }

  auto view = payload(entry);
  return std::vector<uint8_t>(view.begin(), view.end());
}

void Archive::close() {
  dataFile_.close();
  table_ = EntryTable();
}

std::optional<Manifest> ArchiveExtractor::extract(std::span<const uint8_t> infoBytes,
                                                  std::span<const uint8_t> dataBytes,
                                                  const std::filesystem::path &manifestPath,
                                                  const ExtractOptions &options,
                                                  Error *outError) {
  auto table = InfoCodec::parse(infoBytes, outError);
  if (!table) {
    return std::nullopt;
  }

  if (!table->validate(dataBytes.size(), outError)) {
    return std::nullopt;
  }

  auto payloads = DataBlockCodec::readAll(dataBytes, *table, outError);
  if (!payloads) {
    return std::nullopt;
  }

  // Archives laid out some other way still extract; rebuild packs them with the default
  ManifestOptions manifestOptions;
  manifestOptions.layout =
      DataBlockCodec::detectLayout(*table, dataBytes.size()).value_or(Layout{});
  manifestOptions.payloadExtension = options.payloadExtension;

  if (!preparePayloadDirectory(paths::payloadDirectoryFor(manifestPath), options.overwrite,
                               outError)) {
    return std::nullopt;
  }

  return ManifestBridge::toManifest(*table, *payloads, manifestPath, manifestOptions, outError);
}

std::optional<Manifest> ArchiveExtractor::extractFiles(const std::filesystem::path &dataPath,
                                                       const std::filesystem::path &manifestPath,
                                                       const ExtractOptions &options,
                                                       Error *outError) {
  MappedFile dataFile;
  if (!dataFile.openRead(dataPath, outError)) {
    return std::nullopt;
  }

  MappedFile infoFile;
  if (!infoFile.openRead(paths::companionInfoPath(dataPath), outError)) {
    return std::nullopt;
  }

  return extract(infoFile.data(), dataFile.data(), manifestPath, options, outError);
}

std::optional<BuiltArchive> ArchiveBuilder::rebuild(const Manifest &manifest, Error *outError) {
  if (!DataBlockCodec::isValidAlignment(manifest.alignment)) {
    detail::fail(outError, ErrorCode::InvalidArgument,
                 std::format("Alignment must be a power of two (got {})", manifest.alignment));
    return std::nullopt;
  }

  auto payloads = ManifestBridge::fromManifest(manifest, outError);
  if (!payloads) {
    return std::nullopt;
  }

  auto block = DataBlockCodec::writeAll(*payloads, manifest.layout(), outError);
  if (!block) {
    return std::nullopt;
  }

  if (!block->table.validate(block->bytes.size(), outError)) {
    return std::nullopt;
  }

  auto info = InfoCodec::serialize(block->table, outError);
  if (!info) {
    return std::nullopt;
  }

  BuiltArchive built;
  built.info = std::move(*info);
  built.data = std::move(block->bytes);
  built.table = std::move(block->table);
  return built;
}

bool ArchiveBuilder::rebuildFiles(const std::filesystem::path &manifestPath,
                                  const std::filesystem::path &dataPath,
                                  const std::filesystem::path &infoPath,
                                  const RebuildOptions &options, Error *outError) {
  auto manifest = ManifestBridge::load(manifestPath, outError);
  if (!manifest) {
    return false;
  }

  if (options.alignment) {
    manifest->alignment = *options.alignment;
  }

  auto built = rebuild(*manifest, outError);
  if (!built) {
    return false;
  }

  // Both buffers exist in full; only now touch the disk
  for (const auto &path : {dataPath, infoPath}) {
    if (path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec) {
        return detail::fail(outError, ErrorCode::IoError,
                            std::format("Failed to create directory {}: {}",
                                        path.parent_path().string(), ec.message()));
      }
    }
  }

  // Stage both files next to their targets, then move them into place
  const std::filesystem::path stagedData = stagingPath(dataPath);
  const std::filesystem::path stagedInfo = stagingPath(infoPath);

  if (!detail::writeFile(stagedData, built->data, outError)) {
    discard(stagedData);
    return false;
  }

  if (!detail::writeFile(stagedInfo, built->info, outError)) {
    discard(stagedData);
    discard(stagedInfo);
    return false;
  }

  if (!commit(stagedData, dataPath, outError)) {
    discard(stagedInfo);
    return false;
  }

  return commit(stagedInfo, infoPath, outError);
}

} // namespace kdm
