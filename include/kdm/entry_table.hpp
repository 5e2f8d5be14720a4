#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace kdm {

// Ordered entry descriptors of one archive, in on-disk order.
// Immutable once built; a rebuild produces a whole new table.
class EntryTable {
public:
  EntryTable() = default;
  explicit EntryTable(std::vector<Entry> entries);

  // Check name uniqueness, offset ordering, range overlap and (when dataLength is given)
  // that every extent fits inside the data file.
  // Returns false with MalformedTable naming the first offending entry.
  bool validate(std::optional<uint64_t> dataLength = std::nullopt,
                Error *outError = nullptr) const;

  // Exact name lookup
  // Returns nullptr with NotFound if the name is not in the table
  const Entry *lookup(const std::string &name, Error *outError = nullptr) const;

  const std::vector<Entry> &entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  const Entry &operator[](size_t index) const { return entries_[index]; }

  std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
  std::vector<Entry>::const_iterator end() const { return entries_.end(); }

  bool operator==(const EntryTable &other) const { return entries_ == other.entries_; }

private:
  std::vector<Entry> entries_;
  std::unordered_map<std::string, size_t> lookup_; // name -> first index
};

} // namespace kdm
