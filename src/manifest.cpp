#include <format>
#include <limits>
#include <system_error>

#include <nlohmann/json.hpp>

#include <kdm/manifest.hpp>
#include <kdm/paths.hpp>

#include "file_io.hpp"

namespace kdm {

namespace {

using json = nlohmann::ordered_json;

bool readUint32(const json &value, uint32_t &out) {
  if (!value.is_number_unsigned()) {
    return false;
  }
  const auto parsed = value.get<uint64_t>();
  if (parsed > std::numeric_limits<uint32_t>::max()) {
    return false;
  }
  out = static_cast<uint32_t>(parsed);
  return true;
}

bool manifestError(Error *outError, std::string message) {
  return detail::fail(outError, ErrorCode::ManifestError, std::move(message));
}

} // namespace

bool ManifestBridge::isValidPayloadName(std::string_view name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

std::optional<Manifest> ManifestBridge::toManifest(const EntryTable &table,
                                                   const PayloadMap &payloads,
                                                   const std::filesystem::path &manifestPath,
                                                   const ManifestOptions &options,
                                                   Error *outError) {
  // Check every name before touching the disk
  for (size_t i = 0; i < table.size(); ++i) {
    if (!isValidPayloadName(table[i].name)) {
      detail::fail(outError, ErrorCode::EncodingError,
                   std::format("Entry {} ('{}') cannot be used as a file name", i, table[i].name));
      return std::nullopt;
    }
  }

  Manifest manifest;
  manifest.alignment = options.layout.alignment;
  manifest.padTail = options.layout.padTail;
  manifest.payloadExtension = options.payloadExtension;
  manifest.payloadDirectory = paths::payloadDirectoryFor(manifestPath);
  manifest.entries.reserve(table.size());

  std::error_code ec;
  std::filesystem::create_directories(manifest.payloadDirectory, ec);
  if (ec) {
    detail::fail(outError, ErrorCode::IoError,
                 std::format("Failed to create payload directory {}: {}",
                             manifest.payloadDirectory.string(), ec.message()));
    return std::nullopt;
  }

  for (size_t i = 0; i < table.size(); ++i) {
    const auto &entry = table[i];

    auto it = payloads.find(entry.name);
    if (it == payloads.end()) {
      detail::fail(outError, ErrorCode::NotFound,
                   std::format("No payload bytes for entry {} ('{}')", i, entry.name));
      return std::nullopt;
    }

    ManifestEntry record;
    record.name = entry.name;
    record.size = entry.size;
    record.flags = entry.flags;

    if (!detail::writeFile(manifest.payloadPath(record), it->second, outError)) {
      return std::nullopt;
    }

    manifest.entries.push_back(std::move(record));
  }

  if (!save(manifest, manifestPath, outError)) {
    return std::nullopt;
  }

  return manifest;
}

std::optional<std::vector<Payload>> ManifestBridge::fromManifest(const Manifest &manifest,
                                                                 Error *outError) {
  std::vector<Payload> payloads;
  payloads.reserve(manifest.entries.size());

  for (size_t i = 0; i < manifest.entries.size(); ++i) {
    const auto &record = manifest.entries[i];

    if (!isValidPayloadName(record.name)) {
      detail::fail(outError, ErrorCode::EncodingError,
                   std::format("Entry {} ('{}') cannot be used as a file name", i, record.name));
      return std::nullopt;
    }

    const auto path = manifest.payloadPath(record);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      detail::fail(outError, ErrorCode::MissingPayloadFile,
                   std::format("Entry {} ('{}') payload file not found: {}", i, record.name,
                               path.string()));
      return std::nullopt;
    }

    auto data = detail::readFile(path, outError);
    if (!data) {
      return std::nullopt;
    }

    if (record.size && *record.size != data->size()) {
      detail::fail(outError, ErrorCode::SizeMismatch,
                   std::format("Entry {} ('{}') declares size {} but {} holds {} bytes", i,
                               record.name, *record.size, path.string(), data->size()));
      return std::nullopt;
    }

    Payload payload;
    payload.name = record.name;
    payload.flags = record.flags;
    payload.data = std::move(*data);
    payloads.push_back(std::move(payload));
  }

  return payloads;
}

std::optional<std::string> ManifestBridge::encode(const Manifest &manifest,
                                                  const std::filesystem::path &baseDirectory,
                                                  Error *outError) {
  std::filesystem::path payloadDir = manifest.payloadDirectory;
  if (!baseDirectory.empty()) {
    std::error_code dirError;
    std::error_code baseError;
    const auto absoluteDir = std::filesystem::absolute(payloadDir, dirError);
    const auto absoluteBase = std::filesystem::absolute(baseDirectory, baseError);
    if (dirError || baseError) {
      const auto &ec = dirError ? dirError : baseError;
      detail::fail(outError, ErrorCode::IoError,
                   std::format("Failed to resolve payload directory {}: {}", payloadDir.string(),
                               ec.message()));
      return std::nullopt;
    }

    // Different roots have no relative form; keep the absolute path then
    auto relative = absoluteDir.lexically_relative(absoluteBase);
    payloadDir = relative.empty() ? absoluteDir : relative;
  }

  json doc;
  doc["alignment"] = manifest.alignment;
  doc["pad_tail"] = manifest.padTail;
  doc["payload_dir"] = payloadDir.generic_string();
  doc["payload_extension"] = manifest.payloadExtension;

  json entries = json::array();
  for (const auto &record : manifest.entries) {
    json item;
    item["name"] = record.name;
    if (record.size) {
      item["size"] = *record.size;
    } else {
      item["size"] = nullptr;
    }
    item["flags"] = record.flags;
    entries.push_back(std::move(item));
  }
  doc["entries"] = std::move(entries);

  try {
    return doc.dump(2) + "\n";
  } catch (const json::type_error &e) {
    // Names are stored as raw bytes; JSON requires UTF-8
    detail::fail(outError, ErrorCode::EncodingError,
                 std::format("Manifest cannot be written as JSON: {}", e.what()));
    return std::nullopt;
  }
}

std::optional<Manifest> ManifestBridge::decode(std::string_view text,
                                               const std::filesystem::path &baseDirectory,
                                               Error *outError) {
  const json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    manifestError(outError, "Manifest is not valid JSON");
    return std::nullopt;
  }

  if (!doc.is_object()) {
    manifestError(outError, "Manifest root must be an object");
    return std::nullopt;
  }

  Manifest manifest;

  if (doc.contains("alignment")) {
    if (!readUint32(doc["alignment"], manifest.alignment) ||
        !DataBlockCodec::isValidAlignment(manifest.alignment)) {
      manifestError(outError, "'alignment' must be a power of two");
      return std::nullopt;
    }
  }

  if (doc.contains("pad_tail")) {
    if (!doc["pad_tail"].is_boolean()) {
      manifestError(outError, "'pad_tail' must be true or false");
      return std::nullopt;
    }
    manifest.padTail = doc["pad_tail"].get<bool>();
  }

  if (!doc.contains("payload_dir") || !doc["payload_dir"].is_string()) {
    manifestError(outError, "'payload_dir' must be a string");
    return std::nullopt;
  }
  std::filesystem::path payloadDir(doc["payload_dir"].get<std::string>());
  manifest.payloadDirectory =
      payloadDir.is_relative() && !baseDirectory.empty() ? baseDirectory / payloadDir : payloadDir;

  if (doc.contains("payload_extension")) {
    if (!doc["payload_extension"].is_string()) {
      manifestError(outError, "'payload_extension' must be a string");
      return std::nullopt;
    }
    manifest.payloadExtension = doc["payload_extension"].get<std::string>();
  }

  if (!doc.contains("entries") || !doc["entries"].is_array()) {
    manifestError(outError, "'entries' must be an array");
    return std::nullopt;
  }

  const auto &entries = doc["entries"];
  manifest.entries.reserve(entries.size());

  for (size_t i = 0; i < entries.size(); ++i) {
    const auto &item = entries[i];
    if (!item.is_object()) {
      manifestError(outError, std::format("entries[{}] must be an object", i));
      return std::nullopt;
    }

    ManifestEntry record;

    if (!item.contains("name") || !item["name"].is_string()) {
      manifestError(outError, std::format("entries[{}].name must be a string", i));
      return std::nullopt;
    }
    record.name = item["name"].get<std::string>();

    if (item.contains("size") && !item["size"].is_null()) {
      uint32_t size = 0;
      if (!readUint32(item["size"], size)) {
        manifestError(outError,
                      std::format("entries[{}].size ('{}') must be an unsigned 32-bit integer",
                                  i, record.name));
        return std::nullopt;
      }
      record.size = size;
    }

    // Required; there is no default
    if (!item.contains("flags") || !readUint32(item["flags"], record.flags)) {
      manifestError(outError,
                    std::format("entries[{}].flags ('{}') must be an unsigned 32-bit integer", i,
                                record.name));
      return std::nullopt;
    }

    manifest.entries.push_back(std::move(record));
  }

  return manifest;
}

bool ManifestBridge::save(const Manifest &manifest, const std::filesystem::path &path,
                          Error *outError) {
  auto text = encode(manifest, path.parent_path(), outError);
  if (!text) {
    return false;
  }

  return detail::writeFile(
      path, std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(text->data()), text->size()),
      outError);
}

std::optional<Manifest> ManifestBridge::load(const std::filesystem::path &path, Error *outError) {
  auto bytes = detail::readFile(path, outError);
  if (!bytes) {
    return std::nullopt;
  }

  std::string_view text(reinterpret_cast<const char *>(bytes->data()), bytes->size());
  return decode(text, path.parent_path(), outError);
}

} // namespace kdm
