#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "types.hpp"

namespace kdm {

// RAII owner of a read-only view of an input file. Only the view is held;
// the file descriptor is closed as soon as the mapping exists.
// Empty files open successfully and expose an empty view.
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Open file for reading (memory-mapped)
  // Fails with IoError if the file cannot be opened or mapped
  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(view_), size_);
  }

  // Unmap the view; the object can be reopened afterwards
  void close();

  bool isOpen() const { return open_; }

  size_t size() const { return size_; }

private:
  void unmap() noexcept;

  void *view_ = nullptr;
  size_t size_ = 0;
  bool open_ = false;
};

} // namespace kdm
