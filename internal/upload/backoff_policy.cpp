#include "backoff_policy.hpp"

#include <algorithm>
#include <stdexcept>

namespace recsync::upload {

namespace {

// FNV-1a; stable across runs and platforms.
uint64_t Fnv1a(uint64_t hash, const void* data, size_t size) {
  const auto* bytes = static_cast<const unsigned char*>(data);
  for (size_t i = 0; i < size; ++i) {
    hash ^= bytes[i];
    hash *= 1099511628211ull;
  }
  return hash;
}

double UnitInterval(std::string_view recording_id, uint32_t index, uint32_t retry_count) {
  uint64_t hash = 14695981039346656037ull;
  hash          = Fnv1a(hash, recording_id.data(), recording_id.size());
  hash          = Fnv1a(hash, &index, sizeof(index));
  hash          = Fnv1a(hash, &retry_count, sizeof(retry_count));
  return static_cast<double>(hash >> 11) / static_cast<double>(1ull << 53);
}

} // namespace

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds max, double jitter_ratio)
    : base_(base), max_(max), jitter_ratio_(jitter_ratio) {
  if (base_.count() <= 0) {
    throw std::invalid_argument("base backoff must be positive");
  }
  if (max_ < base_) {
    throw std::invalid_argument("max backoff must be >= base backoff");
  }
  if (jitter_ratio_ < 0.0 || jitter_ratio_ > 1.0) {
    throw std::invalid_argument("jitter ratio must be within [0, 1]");
  }
}

std::chrono::milliseconds BackoffPolicy::Delay(uint32_t retry_count) const {
  if (retry_count == 0) {
    return std::chrono::milliseconds(0);
  }

  auto delay = base_;
  for (uint32_t i = 0; i < retry_count && delay < max_; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_);
}

std::chrono::milliseconds BackoffPolicy::Delay(std::string_view recording_id, uint32_t index, uint32_t retry_count) const {
  const auto delay = Delay(retry_count);
  if (jitter_ratio_ == 0.0 || delay.count() == 0) {
    return delay;
  }

  const double stretched = static_cast<double>(delay.count()) * (1.0 + jitter_ratio_ * UnitInterval(recording_id, index, retry_count));
  const auto   jittered  = std::chrono::milliseconds(static_cast<int64_t>(stretched));
  return std::min(std::max(jittered, delay), max_);
}

bool BackoffPolicy::IsEligible(std::string_view recording_id, const model::ChunkEntry& entry, util::TimePoint now) const {
  if (entry.status != model::ChunkStatus::kPending) {
    return false;
  }
  if (entry.retry_count == 0 || !entry.last_attempt_at) {
    return true;
  }
  return now - *entry.last_attempt_at >= Delay(recording_id, entry.index, entry.retry_count);
}

} // namespace recsync::upload
