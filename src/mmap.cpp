#include <format>
#include <utility>

#include <kdm/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace kdm {

namespace {

#ifdef _WIN32
struct HandleCloser {
  HANDLE handle = nullptr;
  ~HandleCloser() {
    if (handle && handle != INVALID_HANDLE_VALUE) {
      CloseHandle(handle);
    }
  }
};
#else
struct FdCloser {
  int fd = -1;
  ~FdCloser() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
};
#endif

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  unmap();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : view_(std::exchange(other.view_, nullptr)), size_(std::exchange(other.size_, 0)),
      open_(std::exchange(other.open_, false)) {}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    unmap();
    view_ = std::exchange(other.view_, nullptr);
    size_ = std::exchange(other.size_, 0);
    open_ = std::exchange(other.open_, false);
  }
  return *this;
}

// The view outlives the descriptor/handles it was created from; they are released on return.
bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  HandleCloser file{CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                                OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr)};
  if (file.handle == INVALID_HANDLE_VALUE) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Cannot open {} (error {})", path.string(), GetLastError()));
  }

  LARGE_INTEGER length;
  if (!GetFileSizeEx(file.handle, &length)) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Cannot query size of {}", path.string()));
  }

  const auto size = static_cast<size_t>(length.QuadPart);
  if (size == 0) {
    open_ = true;
    return true;
  }

  HandleCloser mapping{
      CreateFileMappingW(file.handle, nullptr, PAGE_READONLY, 0, 0, nullptr)};
  if (!mapping.handle) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Cannot create mapping for {}", path.string()));
  }

  void *view = MapViewOfFile(mapping.handle, FILE_MAP_READ, 0, 0, 0);
  if (!view) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Cannot map {}", path.string()));
  }
#else
  FdCloser file{::open(path.c_str(), O_RDONLY)};
  if (file.fd < 0) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Cannot open {} (errno: {})", path.string(), errno));
  }

  struct stat st;
  if (fstat(file.fd, &st) < 0) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Cannot stat {} (errno: {})", path.string(), errno));
  }

  if (!S_ISREG(st.st_mode)) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Not a regular file: {}", path.string()));
  }

  // Zero-length files cannot be mapped but are valid (empty) inputs
  const auto size = static_cast<size_t>(st.st_size);
  if (size == 0) {
    open_ = true;
    return true;
  }

  void *view = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, file.fd, 0);
  if (view == MAP_FAILED) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Cannot map {} (errno: {})", path.string(), errno));
  }
#endif

  view_ = view;
  size_ = size;
  open_ = true;
  return true;
}

void MappedFile::close() {
  unmap();
}

void MappedFile::unmap() noexcept {
  if (view_) {
#ifdef _WIN32
    UnmapViewOfFile(view_);
#else
    munmap(view_, size_);
#endif
    view_ = nullptr;
  }
  size_ = 0;
  open_ = false;
}

} // namespace kdm
