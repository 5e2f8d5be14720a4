#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "entry_table.hpp"
#include "manifest.hpp"
#include "mmap.hpp"
#include "types.hpp"

namespace kdm {

// Read access to an info/data pair on disk. The data file stays memory-mapped
// for the lifetime of the object.
class Archive {
public:
  Archive() = default;
  ~Archive() = default;

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept = default;
  Archive &operator=(Archive &&) noexcept = default;

  // Open a data file and its companion info file
  // Returns std::nullopt on failure, with the error in outError if provided
  static std::optional<Archive> open(const std::filesystem::path &dataPath,
                                     Error *outError = nullptr);

  const EntryTable &table() const { return table_; }
  const std::vector<Entry> &entries() const { return table_.entries(); }
  size_t entryCount() const { return table_.size(); }

  const Entry *lookup(const std::string &name, Error *outError = nullptr) const {
    return table_.lookup(name, outError);
  }

  // Get payload view (zero-copy)
  // Returns empty span if the entry bounds are invalid
  std::span<const uint8_t> payload(const Entry &entry) const;

  std::optional<std::vector<uint8_t>> payloadCopy(const Entry &entry,
                                                  Error *outError = nullptr) const;

  std::span<const uint8_t> dataBytes() const { return dataFile_.data(); }

  bool isOpen() const { return dataFile_.isOpen(); }

  void close();

private:
  MappedFile dataFile_;
  EntryTable table_;
};

struct ExtractOptions {
  std::string payloadExtension;
  bool overwrite = false; // Clear a non-empty payload directory instead of refusing
};

struct RebuildOptions {
  std::optional<uint32_t> alignment; // Overrides the manifest's alignment when set
};

class ArchiveExtractor {
public:
  // parse -> validate -> readAll -> toManifest
  // Writes payload files and the manifest document; partial output is not cleaned up on failure.
  static std::optional<Manifest> extract(std::span<const uint8_t> infoBytes,
                                         std::span<const uint8_t> dataBytes,
                                         const std::filesystem::path &manifestPath,
                                         const ExtractOptions &options = {},
                                         Error *outError = nullptr);

  // Map dataPath and its companion info file, then extract
  static std::optional<Manifest> extractFiles(const std::filesystem::path &dataPath,
                                              const std::filesystem::path &manifestPath,
                                              const ExtractOptions &options = {},
                                              Error *outError = nullptr);
};

// Output of a rebuild, complete in memory before anything touches the disk
struct BuiltArchive {
  std::vector<uint8_t> info;
  std::vector<uint8_t> data;
  EntryTable table;
};

class ArchiveBuilder {
public:
  // fromManifest -> writeAll -> validate -> serialize
  static std::optional<BuiltArchive> rebuild(const Manifest &manifest, Error *outError = nullptr);

  // Load the manifest, rebuild in memory, then write the data file and the info file.
  // Both are staged as "<target>.partial" and renamed into place once both writes succeed;
  // existing outputs are left as they were when any earlier stage fails.
  static bool rebuildFiles(const std::filesystem::path &manifestPath,
                           const std::filesystem::path &dataPath,
                           const std::filesystem::path &infoPath,
                           const RebuildOptions &options = {}, Error *outError = nullptr);
};

} // namespace kdm
