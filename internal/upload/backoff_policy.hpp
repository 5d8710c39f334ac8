#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "internal/model/chunk.hpp"

namespace recsync::upload {

/*
  Retry window of a chunk that already failed `retry_count` times:

      delay = min(base * 2^retry_count, max)        retry_count > 0
      delay = 0                                     retry_count == 0

  With jitter_ratio > 0 the delay is stretched by a factor in
  [1, 1 + jitter_ratio) derived from (recording, index, retry_count), so
  the same entry always gets the same window. Jitter never shortens a
  delay and never exceeds max.
*/
class BackoffPolicy {
 public:
  BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds max, double jitter_ratio = 0.0);

  std::chrono::milliseconds Delay(uint32_t retry_count) const;
  std::chrono::milliseconds Delay(std::string_view recording_id, uint32_t index, uint32_t retry_count) const;

  // Pending and past its retry window.
  bool IsEligible(std::string_view recording_id, const model::ChunkEntry& entry, util::TimePoint now) const;

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds max_;
  double                    jitter_ratio_;
};

} // namespace recsync::upload
