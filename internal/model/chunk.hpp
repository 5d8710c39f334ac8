#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace recsync::model {

enum class ChunkStatus : std::uint8_t {
  kPending   = 0,
  kUploading = 1,
  kCompleted = 2,
  kFailed    = 3,
  kCancelled = 4,
};

// Persisted spelling: "pending", "uploading", "completed", "failed", "cancelled".
std::string_view ToString(ChunkStatus status);

// Throws std::invalid_argument on unknown values.
ChunkStatus ParseChunkStatus(std::string_view value);

/*
  Produced once by the chunk writer after the file is committed.
*/
struct ChunkMetadata {
  std::string recording_id;
  uint32_t    index = 0;
  std::string file_path;
  int64_t     size_bytes = 0;
  std::string checksum;
  double      duration_seconds = 0.0;
};

/*
  Upload lifecycle of one chunk. Owned by the manifest store.
*/
struct ChunkEntry {
  uint32_t    index = 0;
  std::string file_path;
  ChunkStatus status = ChunkStatus::kPending;

  std::optional<std::string>     remote_key;
  std::optional<std::string>     integrity_tag;
  uint32_t                       retry_count = 0;
  std::optional<util::TimePoint> last_attempt_at;

  std::string                    checksum;
  int64_t                        size_bytes       = 0;
  double                         duration_seconds = 0.0;
  std::optional<std::string>     last_error;
  uint32_t                       integrity_failures = 0;
  std::optional<util::TimePoint> completed_at;

  static ChunkEntry FromMetadata(const ChunkMetadata& metadata);
};

struct Manifest {
  std::string             recording_id;
  util::TimePoint         created_at{};
  util::TimePoint         updated_at{};
  std::vector<ChunkEntry> chunks;

  const ChunkEntry* Find(uint32_t index) const;
  ChunkEntry*       Find(uint32_t index);
};

struct ManifestSummary {
  std::string recording_id;
  ChunkStatus overall_status = ChunkStatus::kPending;

  uint32_t total     = 0;
  uint32_t pending   = 0;
  uint32_t uploading = 0;
  uint32_t completed = 0;
  uint32_t failed    = 0;
  uint32_t cancelled = 0;

  int64_t total_bytes    = 0;
  int64_t uploaded_bytes = 0;

  // completed / (total - cancelled); 0 for an empty manifest.
  double Progress() const;
};

/*
  Overall status rules:
    all chunks completed (ignoring cancelled)    → completed
    failures present and nothing left to upload  → failed
    any chunk uploading                          → uploading
    otherwise                                    → pending
*/
ManifestSummary Summarize(const Manifest& manifest);

} // namespace recsync::model
