#include <format>

#include <kdm/types.hpp>

namespace kdm {

std::string_view toString(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::TruncatedInfo:
    return "TruncatedInfo";
  case ErrorCode::MalformedTable:
    return "MalformedTable";
  case ErrorCode::OutOfBounds:
    return "OutOfBounds";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::NameTooLong:
    return "NameTooLong";
  case ErrorCode::EncodingError:
    return "EncodingError";
  case ErrorCode::MissingPayloadFile:
    return "MissingPayloadFile";
  case ErrorCode::SizeMismatch:
    return "SizeMismatch";
  case ErrorCode::ManifestError:
    return "ManifestError";
  case ErrorCode::OutputNotEmpty:
    return "OutputNotEmpty";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::IoError:
    return "IoError";
  }
  return "Unknown";
}

std::string Error::describe() const {
  return std::format("{}: {}", toString(code), message);
}

} // namespace kdm
