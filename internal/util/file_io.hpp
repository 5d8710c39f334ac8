#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace recsync::util {

/*
  Crash-safe file replacement:

      write <path>.tmp → fsync → rename over <path> → fsync parent dir

  A crash at any point leaves either the previous file or the new one.
  Throws std::system_error on failure; the temp file is removed.
*/
void WriteFileAtomically(const std::filesystem::path& path, std::string_view contents);

// Writes and fsyncs `contents` at `path` (truncating). Throws std::system_error.
void WriteFileDurably(const std::filesystem::path& path, std::string_view contents);

void FsyncDirectory(const std::filesystem::path& dir);

// Bytes available to unprivileged users on the volume holding `path`.
uint64_t AvailableBytes(const std::filesystem::path& path);

inline std::filesystem::path TempPathFor(const std::filesystem::path& path) {
  auto tmp = path;
  tmp += ".tmp";
  return tmp;
}

} // namespace recsync::util
