#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "entry_table.hpp"
#include "types.hpp"

namespace kdm {

// Zero-copy views into a data file, keyed by entry name
using PayloadMap = std::unordered_map<std::string, std::span<const uint8_t>>;

// How payloads are placed in a data file: each one starts on a multiple of alignment.
// padTail decides whether the last payload is followed by padding as well.
struct Layout {
  uint32_t alignment = kDefaultAlignment;
  bool padTail = true;

  bool operator==(const Layout &) const = default;
};

// A freshly laid out data file together with the table that describes it
struct DataBlock {
  std::vector<uint8_t> bytes;
  EntryTable table;
};

class DataBlockCodec {
public:
  // Slice every entry out of the data file.
  // Fails with OutOfBounds if an extent runs past the end of dataBytes.
  static std::optional<PayloadMap> readAll(std::span<const uint8_t> dataBytes,
                                           const EntryTable &table, Error *outError = nullptr);

  // Concatenate payloads in order, zero-padding after each one so the next offset
  // is a multiple of alignment. Deterministic for a given input.
  static std::optional<DataBlock> writeAll(std::span<const Payload> payloads,
                                           const Layout &layout, Error *outError = nullptr);

  static std::optional<DataBlock> writeAll(std::span<const Payload> payloads, uint32_t alignment,
                                           Error *outError = nullptr) {
    return writeAll(payloads, Layout{alignment, true}, outError);
  }

  // Smallest power-of-two alignment (up to kMaxDetectedAlignment) whose writeAll layout
  // reproduces the table's offsets and the data file length exactly. At equal alignment
  // a padded tail is preferred over an unpadded one.
  static std::optional<Layout> detectLayout(const EntryTable &table, uint64_t dataLength);

  static constexpr bool isValidAlignment(uint32_t alignment) {
    return alignment != 0 && (alignment & (alignment - 1)) == 0;
  }

  static constexpr uint64_t paddingFor(uint64_t end, uint32_t alignment) {
    return (alignment - end % alignment) % alignment;
  }

  static constexpr uint64_t alignUp(uint64_t value, uint32_t alignment) {
    return value + paddingFor(value, alignment);
  }
};

} // namespace kdm
