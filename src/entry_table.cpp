#include <format>

#include <kdm/entry_table.hpp>

namespace kdm {

EntryTable::EntryTable(std::vector<Entry> entries) : entries_(std::move(entries)) {
  lookup_.reserve(entries_.size());
  for (size_t i = 0; i < entries_.size(); ++i) {
    lookup_.try_emplace(entries_[i].name, i);
  }
}

bool EntryTable::validate(std::optional<uint64_t> dataLength, Error *outError) const {
  std::unordered_map<std::string, size_t> seen;
  seen.reserve(entries_.size());

  uint64_t previousOffset = 0;
  uint64_t coveredEnd = 0; // End of the furthest non-empty range so far
  std::optional<size_t> coveringIndex;

  for (size_t i = 0; i < entries_.size(); ++i) {
    const auto &entry = entries_[i];
    const uint64_t offset = entry.offset;
    const uint64_t end = offset + entry.size;

    auto [it, inserted] = seen.try_emplace(entry.name, i);
    if (!inserted) {
      return detail::fail(outError, ErrorCode::MalformedTable,
                          std::format("Entry {} ('{}') duplicates the name of entry {}", i,
                                      entry.name, it->second));
    }

    if (offset < previousOffset) {
      return detail::fail(
          outError, ErrorCode::MalformedTable,
          std::format("Entry {} ('{}') has offset {} below the previous entry's offset {}", i,
                      entry.name, offset, previousOffset));
    }

    // Empty ranges cannot intersect anything
    if (entry.size != 0) {
      if (coveringIndex && offset < coveredEnd) {
        return detail::fail(
            outError, ErrorCode::MalformedTable,
            std::format("Entry {} ('{}') at [{}, {}) overlaps entry {} ('{}') ending at {}", i,
                        entry.name, offset, end, *coveringIndex,
                        entries_[*coveringIndex].name, coveredEnd));
      }
      coveredEnd = end;
      coveringIndex = i;
    }

    if (dataLength && end > *dataLength) {
      return detail::fail(
          outError, ErrorCode::MalformedTable,
          std::format("Entry {} ('{}') has invalid offset/size (offset={}, size={}, dataSize={})",
                      i, entry.name, offset, entry.size, *dataLength));
    }

    previousOffset = offset;
  }

  return true;
}

const Entry *EntryTable::lookup(const std::string &name, Error *outError) const {
  auto it = lookup_.find(name);
  if (it == lookup_.end()) {
    detail::fail(outError, ErrorCode::NotFound, std::format("No entry named '{}'", name));
    return nullptr;
  }
  return &entries_[it->second];
}

} // namespace kdm
