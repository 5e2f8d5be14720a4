#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "data_block.hpp"
#include "entry_table.hpp"
#include "types.hpp"

namespace kdm {

// One editable manifest record. Offsets are never authored; they come from the layout.
struct ManifestEntry {
  std::string name;
  std::optional<uint32_t> size; // When present, must match the payload file length
  uint32_t flags = 0;

  bool operator==(const ManifestEntry &) const = default;
};

// Human-editable description of an archive, persisted between extract and rebuild
struct Manifest {
  uint32_t alignment = kDefaultAlignment;
  bool padTail = true; // Pad after the last payload too
  std::filesystem::path payloadDirectory;
  std::string payloadExtension;
  std::vector<ManifestEntry> entries;

  Layout layout() const { return Layout{alignment, padTail}; }

  // Where the payload of an entry lives on disk
  std::filesystem::path payloadPath(const ManifestEntry &entry) const {
    return payloadDirectory / (entry.name + payloadExtension);
  }
};

struct ManifestOptions {
  Layout layout;
  std::string payloadExtension;
};

class ManifestBridge {
public:
  // Build the manifest for a parsed archive and write it out: one payload file per entry
  // under payloadDirectoryFor(manifestPath), then the manifest document at manifestPath.
  // Manifest order mirrors table order.
  static std::optional<Manifest> toManifest(const EntryTable &table, const PayloadMap &payloads,
                                            const std::filesystem::path &manifestPath,
                                            const ManifestOptions &options,
                                            Error *outError = nullptr);

  // Read every payload file referenced by the manifest, in manifest order.
  // Fails with MissingPayloadFile naming the first absent file.
  static std::optional<std::vector<Payload>> fromManifest(const Manifest &manifest,
                                                          Error *outError = nullptr);

  // JSON document codec. payload_dir is stored relative to baseDirectory when both can be
  // made absolute; a relative payloadDirectory is taken against the working directory.
  static std::optional<std::string> encode(const Manifest &manifest,
                                           const std::filesystem::path &baseDirectory,
                                           Error *outError = nullptr);
  static std::optional<Manifest> decode(std::string_view text,
                                        const std::filesystem::path &baseDirectory,
                                        Error *outError = nullptr);

  static bool save(const Manifest &manifest, const std::filesystem::path &path,
                   Error *outError = nullptr);
  static std::optional<Manifest> load(const std::filesystem::path &path,
                                      Error *outError = nullptr);

  // True if name can be used as a single file name inside the payload directory
  static bool isValidPayloadName(std::string_view name);
};

} // namespace kdm
