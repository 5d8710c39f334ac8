#include "chunk_writer.hpp"

#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/sha256.hpp"

namespace recsync::chunk {

using storage::common::ChunkFileName;
using storage::common::ValidateRecordingId;

ChunkWriter::ChunkWriter(config::CaptureSettings settings) : settings_(std::move(settings)) {
  std::filesystem::create_directories(settings_.chunk_dir);
}

std::filesystem::path ChunkWriter::ChunkPath(const std::string& recording_id, uint32_t index) const {
  ValidateRecordingId(recording_id);
  return settings_.chunk_dir / recording_id / ChunkFileName(recording_id, index, settings_.file_extension);
}

std::string ChunkWriter::ComputeFileChecksum(const std::filesystem::path& path) {
  return util::Sha256File(path);
}

void ChunkWriter::EnsureCapacity(const std::filesystem::path& dir, uint64_t size_bytes) const {
  uint64_t available = 0;
  try {
    available = util::AvailableBytes(dir);
  } catch (const std::system_error& e) {
    throw util::ChunkWriteFailed(std::string("free space check failed: ") + e.what());
  }

  const uint64_t required = settings_.min_free_bytes + size_bytes;
  if (available < required) {
    RECSYNC_LOG_ERROR("insufficient storage for chunk",
                      {observability::StringField("dir", dir.string()),
                       observability::IntField("available_bytes", static_cast<int64_t>(available)),
                       observability::IntField("required_bytes", static_cast<int64_t>(required))});
    throw util::InsufficientStorage("insufficient storage: " + std::to_string(available) + " bytes available, " + std::to_string(required) +
                                    " required");
  }
}

model::ChunkMetadata ChunkWriter::Finalize(const ChunkBuffer& buffer) {
  if (!buffer.data) {
    throw std::invalid_argument("chunk buffer has no data");
  }

  const auto final_path = ChunkPath(buffer.recording_id, buffer.index);
  const auto dir        = final_path.parent_path();
  const auto tmp_path   = util::TempPathFor(final_path);

  try {
    std::filesystem::create_directories(dir);
  } catch (const std::filesystem::filesystem_error& e) {
    throw util::ChunkWriteFailed(std::string("create chunk directory: ") + e.what());
  }

  EnsureCapacity(dir, static_cast<uint64_t>(buffer.data->size()));

  model::ChunkMetadata metadata;
  metadata.recording_id     = buffer.recording_id;
  metadata.index            = buffer.index;
  metadata.file_path        = final_path.string();
  metadata.size_bytes       = buffer.data->size();
  metadata.duration_seconds = buffer.duration_seconds;

  try {
    util::WriteFileDurably(tmp_path, std::string_view(reinterpret_cast<const char*>(buffer.data->data()), buffer.data->size()));
    metadata.checksum = util::Sha256File(tmp_path);
    std::filesystem::rename(tmp_path, final_path);
    util::FsyncDirectory(dir);
  } catch (const std::exception& e) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    RECSYNC_LOG_ERROR("chunk write failed", {observability::StringField("path", final_path.string()), observability::StringField("error", e.what())});
    throw util::ChunkWriteFailed("chunk write failed for " + final_path.string() + ": " + e.what());
  }

  RECSYNC_LOG_INFO("chunk finalized",
                   {observability::StringField("recording_id", metadata.recording_id), observability::IntField("index", metadata.index),
                    observability::IntField("size_bytes", metadata.size_bytes), observability::StringField("checksum", metadata.checksum)});
  return metadata;
}

} // namespace recsync::chunk
