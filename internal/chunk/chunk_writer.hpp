#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/config/settings.hpp"
#include "internal/model/chunk.hpp"

namespace recsync::chunk {

/*
  One captured segment handed over by the capture side.
*/
struct ChunkBuffer {
  std::string                    recording_id;
  uint32_t                       index = 0;
  std::shared_ptr<arrow::Buffer> data;
  double                         duration_seconds = 0.0;
};

/*
  Turns capture buffers into committed chunk files.

  Commit sequence:

      <final>.tmp ← data, fsync
      checksum    ← SHA-256 of the temp file read back
      rename <final>.tmp → <final>, fsync directory

  Readers never see a partially written chunk under its final name.
*/
class ChunkWriter {
 public:
  explicit ChunkWriter(config::CaptureSettings settings);

  /*
    Throws:
      util::InsufficientStorage  free space < min_free_bytes + buffer size
      util::ChunkWriteFailed     any I/O error (temp file removed)
      std::invalid_argument      bad recording id / null buffer
  */
  model::ChunkMetadata Finalize(const ChunkBuffer& buffer);

  std::filesystem::path ChunkPath(const std::string& recording_id, uint32_t index) const;

  static std::string ComputeFileChecksum(const std::filesystem::path& path);

  const std::filesystem::path& root() const {
    return settings_.chunk_dir;
  }

 private:
  void EnsureCapacity(const std::filesystem::path& dir, uint64_t size_bytes) const;

  config::CaptureSettings settings_;
};

} // namespace recsync::chunk
