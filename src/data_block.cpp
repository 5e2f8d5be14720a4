#include <cstring>
#include <format>
#include <limits>

#include <kdm/data_block.hpp>

namespace kdm {

std::optional<PayloadMap> DataBlockCodec::readAll(std::span<const uint8_t> dataBytes,
                                                  const EntryTable &table, Error *outError) {
  PayloadMap payloads;
  payloads.reserve(table.size());

  for (size_t i = 0; i < table.size(); ++i) {
    const auto &entry = table[i];
    const uint64_t end = static_cast<uint64_t>(entry.offset) + entry.size;

    // The table was validated against a declared length; check against the real buffer
    if (end > dataBytes.size()) {
      detail::fail(outError, ErrorCode::OutOfBounds,
                   std::format("Entry {} ('{}') extent [{}, {}) exceeds data file size {}", i,
                               entry.name, entry.offset, end, dataBytes.size()));
      return std::nullopt;
    }

    payloads.emplace(entry.name, dataBytes.subspan(entry.offset, entry.size));
  }

  return payloads;
}

std::optional<DataBlock> DataBlockCodec::writeAll(std::span<const Payload> payloads,
                                                  const Layout &layout, Error *outError) {
  const uint32_t alignment = layout.alignment;
  if (!isValidAlignment(alignment)) {
    detail::fail(outError, ErrorCode::InvalidArgument,
                 std::format("Alignment must be a power of two (got {})", alignment));
    return std::nullopt;
  }

  // Step 1: Assign offsets
  std::vector<Entry> entries;
  entries.reserve(payloads.size());

  uint64_t pos = 0;
  for (size_t i = 0; i < payloads.size(); ++i) {
    const auto &payload = payloads[i];

    if (pos > std::numeric_limits<uint32_t>::max() ||
        payload.data.size() > std::numeric_limits<uint32_t>::max()) {
      detail::fail(outError, ErrorCode::EncodingError,
                   std::format("Entry {} ('{}') does not fit in 32-bit offset/size (offset={}, "
                               "size={})",
                               i, payload.name, pos, payload.data.size()));
      return std::nullopt;
    }

    Entry entry;
    entry.name = payload.name;
    entry.offset = static_cast<uint32_t>(pos);
    entry.size = static_cast<uint32_t>(payload.data.size());
    entry.flags = payload.flags;
    entries.push_back(std::move(entry));

    const uint64_t end = pos + payload.data.size();
    const bool last = i + 1 == payloads.size();
    pos = last && !layout.padTail ? end : alignUp(end, alignment);
  }

  // Step 2: Copy payloads; padding is already zero
  DataBlock block;
  block.bytes.assign(static_cast<size_t>(pos), 0);

  for (size_t i = 0; i < payloads.size(); ++i) {
    const auto &data = payloads[i].data;
    if (!data.empty()) {
      std::memcpy(block.bytes.data() + entries[i].offset, data.data(), data.size());
    }
  }

  block.table = EntryTable(std::move(entries));
  return block;
}

std::optional<Layout> DataBlockCodec::detectLayout(const EntryTable &table,
                                                  uint64_t dataLength) {
  for (uint32_t alignment = 1; alignment <= kMaxDetectedAlignment; alignment <<= 1) {
    uint64_t pos = 0;
    uint64_t end = 0;
    bool matches = true;

    for (const auto &entry : table) {
      if (entry.offset != pos) {
        matches = false;
        break;
      }
      end = pos + entry.size;
      pos = alignUp(end, alignment);
    }

    if (!matches) {
      continue;
    }
    if (pos == dataLength) {
      return Layout{alignment, true};
    }
    if (end == dataLength) {
      return Layout{alignment, false};
    }
  }

  return std::nullopt;
}

} // namespace kdm
