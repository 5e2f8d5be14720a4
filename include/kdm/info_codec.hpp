#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "entry_table.hpp"
#include "types.hpp"

namespace kdm {

// Translates between info file bytes and an EntryTable.
//
// Layout (little-endian uint32 fields):
//   0x00            entryCount
//   0x04 + 16 * i   nameOffset, dataOffset, flags, size
//   4 + 16 * count  string table of NUL-terminated names (nameOffset is relative to it)
//
// No file I/O happens here; callers own file access.
class InfoCodec {
public:
  // Parse an info file. Entry order matches the on-disk descriptor order.
  // Fails with TruncatedInfo if the buffer cannot hold what it declares,
  // or MalformedTable if the resulting table does not validate.
  static std::optional<EntryTable> parse(std::span<const uint8_t> bytes,
                                         Error *outError = nullptr);

  // Serialize a table. The same table always yields the same bytes.
  // Fails with NameTooLong or EncodingError if a name cannot be stored.
  static std::optional<std::vector<uint8_t>> serialize(const EntryTable &table,
                                                       Error *outError = nullptr);

  // Size of the descriptor block that precedes the string table
  static constexpr uint64_t stringTableOffset(uint64_t entryCount) {
    return kInfoHeaderSize + entryCount * kInfoDescriptorSize;
  }
};

} // namespace kdm
