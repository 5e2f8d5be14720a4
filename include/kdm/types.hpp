#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kdm {

// Info file layout: entryCount, then one descriptor per entry, then the string table
inline constexpr size_t kInfoHeaderSize = 4;
inline constexpr size_t kInfoDescriptorSize = 16;

// Names become file names on extraction
inline constexpr size_t kMaxNameLength = 255;

// The game's own archives are packed without padding
inline constexpr uint32_t kDefaultAlignment = 1;
inline constexpr uint32_t kMaxDetectedAlignment = 4096;

// One named payload inside the data file
struct Entry {
  std::string name;
  uint32_t offset = 0; // Offset within the data file (little-endian when stored)
  uint32_t size = 0;   // Payload size in bytes (little-endian when stored)
  uint32_t flags = 0;  // Opaque descriptor word, passed through unchanged

  bool operator==(const Entry &) const = default;
};

// Payload bytes waiting to be laid out into a data file
struct Payload {
  std::string name;
  uint32_t flags = 0;
  std::vector<uint8_t> data;
};

enum class ErrorCode {
  TruncatedInfo,
  MalformedTable,
  OutOfBounds,
  NotFound,
  NameTooLong,
  EncodingError,
  MissingPayloadFile,
  SizeMismatch,
  ManifestError,
  OutputNotEmpty,
  InvalidArgument,
  IoError,
};

std::string_view toString(ErrorCode code) noexcept;

struct Error {
  ErrorCode code = ErrorCode::IoError;
  std::string message;

  // "<kind>: <message>"
  std::string describe() const;
};

namespace detail {

// Fills outError if provided; always returns false so callers can `return fail(...)`
inline bool fail(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
  return false;
}

} // namespace detail

} // namespace kdm
