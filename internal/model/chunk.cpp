#include "chunk.hpp"

#include <stdexcept>

namespace recsync::model {

std::string_view ToString(ChunkStatus status) {
  switch (status) {
    case ChunkStatus::kPending:
      return "pending";
    case ChunkStatus::kUploading:
      return "uploading";
    case ChunkStatus::kCompleted:
      return "completed";
    case ChunkStatus::kFailed:
      return "failed";
    case ChunkStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

ChunkStatus ParseChunkStatus(std::string_view value) {
  if (value == "pending") return ChunkStatus::kPending;
  if (value == "uploading") return ChunkStatus::kUploading;
  if (value == "completed") return ChunkStatus::kCompleted;
  if (value == "failed") return ChunkStatus::kFailed;
  if (value == "cancelled") return ChunkStatus::kCancelled;
  throw std::invalid_argument("unknown chunk status: " + std::string(value));
}

ChunkEntry ChunkEntry::FromMetadata(const ChunkMetadata& metadata) {
  ChunkEntry entry;
  entry.index            = metadata.index;
  entry.file_path        = metadata.file_path;
  entry.status           = ChunkStatus::kPending;
  entry.checksum         = metadata.checksum;
  entry.size_bytes       = metadata.size_bytes;
  entry.duration_seconds = metadata.duration_seconds;
  return entry;
}

const ChunkEntry* Manifest::Find(uint32_t index) const {
  for (const auto& chunk : chunks) {
    if (chunk.index == index) return &chunk;
  }
  return nullptr;
}

ChunkEntry* Manifest::Find(uint32_t index) {
  for (auto& chunk : chunks) {
    if (chunk.index == index) return &chunk;
  }
  return nullptr;
}

double ManifestSummary::Progress() const {
  const uint32_t considered = total - cancelled;
  if (considered == 0) return 0.0;
  return static_cast<double>(completed) / static_cast<double>(considered);
}

ManifestSummary Summarize(const Manifest& manifest) {
  ManifestSummary summary;
  summary.recording_id = manifest.recording_id;

  for (const auto& chunk : manifest.chunks) {
    ++summary.total;
    summary.total_bytes += chunk.size_bytes;
    switch (chunk.status) {
      case ChunkStatus::kPending:
        ++summary.pending;
        break;
      case ChunkStatus::kUploading:
        ++summary.uploading;
        break;
      case ChunkStatus::kCompleted:
        ++summary.completed;
        summary.uploaded_bytes += chunk.size_bytes;
        break;
      case ChunkStatus::kFailed:
        ++summary.failed;
        break;
      case ChunkStatus::kCancelled:
        ++summary.cancelled;
        break;
    }
  }

  const uint32_t live = summary.total - summary.cancelled;
  if (live > 0 && summary.completed == live) {
    summary.overall_status = ChunkStatus::kCompleted;
  } else if (summary.failed > 0 && summary.pending == 0 && summary.uploading == 0) {
    summary.overall_status = ChunkStatus::kFailed;
  } else if (summary.uploading > 0) {
    summary.overall_status = ChunkStatus::kUploading;
  } else {
    summary.overall_status = ChunkStatus::kPending;
  }
  return summary;
}

} // namespace recsync::model
