#include <format>
#include <fstream>

#include "file_io.hpp"

namespace kdm::detail {

bool writeFile(const std::filesystem::path &path, std::span<const uint8_t> bytes,
               Error *outError) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return fail(outError, ErrorCode::IoError,
                std::format("Failed to create output file: {}", path.string()));
  }

  out.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    return fail(outError, ErrorCode::IoError,
                std::format("Failed to write to output file: {}", path.string()));
  }

  return true;
}

std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path &path, Error *outError) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    fail(outError, ErrorCode::IoError,
         std::format("Failed to open source file: {}", path.string()));
    return std::nullopt;
  }

  const std::streamoff fileSize = in.tellg();
  if (fileSize < 0) {
    fail(outError, ErrorCode::IoError,
         std::format("Failed to get file size: {}", path.string()));
    return std::nullopt;
  }
  in.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(fileSize));
  if (!in.read(reinterpret_cast<char *>(buffer.data()), fileSize)) {
    fail(outError, ErrorCode::IoError,
         std::format("Failed to read source file: {}", path.string()));
    return std::nullopt;
  }

  return buffer;
}

} // namespace kdm::detail
