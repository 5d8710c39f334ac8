#include "file_io.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>

namespace recsync::util {

namespace {

std::system_error ErrnoError(const std::string& what, const std::filesystem::path& path) {
  return std::system_error(errno, std::generic_category(), what + " " + path.string());
}

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {
  }
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const {
    return fd_;
  }

  // Close explicitly so close() errors are reported.
  int Release() {
    int rc = ::close(fd_);
    fd_    = -1;
    return rc;
  }

 private:
  int fd_;
};

void WriteAll(int fd, std::string_view contents, const std::filesystem::path& path) {
  const char* data      = contents.data();
  std::size_t remaining = contents.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, data, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw ErrnoError("write", path);
    }
    data += n;
    remaining -= static_cast<std::size_t>(n);
  }
}

} // namespace

void WriteFileDurably(const std::filesystem::path& path, std::string_view contents) {
  FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (fd.get() < 0) {
    throw ErrnoError("open", path);
  }

  WriteAll(fd.get(), contents, path);

  if (::fsync(fd.get()) != 0) {
    throw ErrnoError("fsync", path);
  }
  if (fd.Release() != 0) {
    throw ErrnoError("close", path);
  }
}

void WriteFileAtomically(const std::filesystem::path& path, std::string_view contents) {
  const auto tmp_path = TempPathFor(path);

  try {
    WriteFileDurably(tmp_path, contents);
    std::filesystem::rename(tmp_path, path);
  } catch (...) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  }

  FsyncDirectory(path.has_parent_path() ? path.parent_path() : std::filesystem::path("."));
}

void FsyncDirectory(const std::filesystem::path& dir) {
  FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (fd.get() < 0) {
    throw ErrnoError("open directory", dir);
  }
  if (::fsync(fd.get()) != 0 && errno != EINVAL) {
    throw ErrnoError("fsync directory", dir);
  }
}

uint64_t AvailableBytes(const std::filesystem::path& path) {
  struct statvfs s {};
  if (::statvfs(path.c_str(), &s) != 0) {
    throw ErrnoError("statvfs", path);
  }
  return static_cast<uint64_t>(s.f_bavail) * s.f_frsize;
}

} // namespace recsync::util
