#include <cstring>
#include <format>
#include <limits>

#include <kdm/endian.hpp>
#include <kdm/info_codec.hpp>

namespace kdm {

std::optional<EntryTable> InfoCodec::parse(std::span<const uint8_t> bytes, Error *outError) {
  // Check minimum size (header is 4 bytes)
  if (bytes.size() < kInfoHeaderSize) {
    detail::fail(outError, ErrorCode::TruncatedInfo,
                 std::format("Info file too small to hold an entry count (size: {})",
                             bytes.size()));
    return std::nullopt;
  }

  const uint32_t entryCount = loadLE32(bytes.data());
  const uint64_t stringTableStart = stringTableOffset(entryCount);

  if (stringTableStart > bytes.size()) {
    detail::fail(outError, ErrorCode::TruncatedInfo,
                 std::format("Info file declares {} entries needing {} bytes, but holds only {}",
                             entryCount, stringTableStart, bytes.size()));
    return std::nullopt;
  }

  std::vector<Entry> entries;
  entries.reserve(entryCount);

  size_t pos = kInfoHeaderSize;
  for (uint32_t i = 0; i < entryCount; ++i) {
    const uint32_t nameOffset = loadLE32(bytes.data() + pos);
    const uint32_t dataOffset = loadLE32(bytes.data() + pos + 4);
    const uint32_t flags = loadLE32(bytes.data() + pos + 8);
    const uint32_t size = loadLE32(bytes.data() + pos + 12);
    pos += kInfoDescriptorSize;

    const uint64_t nameStart = stringTableStart + nameOffset;
    if (nameStart >= bytes.size()) {
      detail::fail(outError, ErrorCode::TruncatedInfo,
                   std::format("Entry {} has name offset {} beyond the info file (size: {})", i,
                               nameOffset, bytes.size()));
      return std::nullopt;
    }

    // Read null-terminated name
    const auto *nameBegin = bytes.data() + nameStart;
    const size_t remaining = bytes.size() - static_cast<size_t>(nameStart);
    const void *terminator = std::memchr(nameBegin, '\0', remaining);
    if (!terminator) {
      detail::fail(outError, ErrorCode::TruncatedInfo,
                   std::format("Entry {} has unterminated name string", i));
      return std::nullopt;
    }

    const size_t nameLength = static_cast<const uint8_t *>(terminator) - nameBegin;

    Entry entry;
    entry.name.assign(reinterpret_cast<const char *>(nameBegin), nameLength);
    entry.offset = dataOffset;
    entry.size = size;
    entry.flags = flags;
    entries.push_back(std::move(entry));
  }

  EntryTable table(std::move(entries));
  if (!table.validate(std::nullopt, outError)) {
    return std::nullopt;
  }

  return table;
}

std::optional<std::vector<uint8_t>> InfoCodec::serialize(const EntryTable &table,
                                                         Error *outError) {
  if (table.size() > std::numeric_limits<uint32_t>::max()) {
    detail::fail(outError, ErrorCode::EncodingError,
                 std::format("Too many entries for a 32-bit count: {}", table.size()));
    return std::nullopt;
  }

  // Step 1: Calculate string table size and check names
  uint64_t stringTableSize = 0;
  for (size_t i = 0; i < table.size(); ++i) {
    const auto &name = table[i].name;

    if (name.find('\0') != std::string::npos) {
      detail::fail(outError, ErrorCode::EncodingError,
                   std::format("Entry {} name contains a NUL byte", i));
      return std::nullopt;
    }

    if (name.size() > kMaxNameLength) {
      detail::fail(outError, ErrorCode::NameTooLong,
                   std::format("Entry {} ('{}') name is {} bytes long (max {})", i, name,
                               name.size(), kMaxNameLength));
      return std::nullopt;
    }

    stringTableSize += name.size() + 1;
  }

  if (stringTableSize > std::numeric_limits<uint32_t>::max()) {
    detail::fail(outError, ErrorCode::EncodingError,
                 std::format("String table of {} bytes exceeds 32-bit offsets", stringTableSize));
    return std::nullopt;
  }

  const uint64_t stringTableStart = stringTableOffset(table.size());
  std::vector<uint8_t> out(static_cast<size_t>(stringTableStart + stringTableSize), 0);

  // Step 2: Header
  storeLE32(out.data(), static_cast<uint32_t>(table.size()));

  // Step 3: Descriptors and names, in table order
  size_t pos = kInfoHeaderSize;
  size_t namePos = static_cast<size_t>(stringTableStart);

  for (const auto &entry : table) {
    storeLE32(out.data() + pos, static_cast<uint32_t>(namePos - stringTableStart));
    storeLE32(out.data() + pos + 4, entry.offset);
    storeLE32(out.data() + pos + 8, entry.flags);
    storeLE32(out.data() + pos + 12, entry.size);
    pos += kInfoDescriptorSize;

    std::memcpy(out.data() + namePos, entry.name.data(), entry.name.size());
    namePos += entry.name.size();
    // Null terminator is already in place
    ++namePos;
  }

  return out;
}

} // namespace kdm
