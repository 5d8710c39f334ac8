#include "manifest_store.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/manifest/manifest_codec.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

namespace recsync::manifest {

using model::ChunkEntry;
using model::ChunkStatus;
using model::Manifest;
using storage::common::ManifestPath;

namespace {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open manifest " + path.string());
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  if (in.bad()) {
    throw std::runtime_error("read failed for manifest " + path.string());
  }
  return contents.str();
}

uint32_t ResetUploading(Manifest& manifest) {
  uint32_t reset = 0;
  for (auto& chunk : manifest.chunks) {
    if (chunk.status == ChunkStatus::kUploading) {
      chunk.status = ChunkStatus::kPending;
      ++reset;
    }
  }
  return reset;
}

ChunkEntry& FindOrThrow(Manifest& manifest, uint32_t index) {
  auto* entry = manifest.Find(index);
  if (!entry) {
    throw util::NotFound("chunk " + std::to_string(index) + " not found in recording " + manifest.recording_id);
  }
  return *entry;
}

} // namespace

ManifestStore::ManifestStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::shared_ptr<std::mutex> ManifestStore::RecordingMutex(const std::string& recording_id) {
  std::lock_guard<std::mutex> lock(recording_mutexes_guard_);
  auto&                       recording_mutex = recording_mutexes_[recording_id];
  if (!recording_mutex) {
    recording_mutex = std::make_shared<std::mutex>();
  }
  return recording_mutex;
}

void ManifestStore::Publish(const Manifest& manifest) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  cache_[manifest.recording_id] = manifest;
}

void ManifestStore::PersistLocked(Manifest& manifest) {
  manifest.updated_at = util::Now();
  util::WriteFileAtomically(ManifestPath(root_, manifest.recording_id), EncodeJson(manifest));
}

Manifest ManifestStore::LoadLocked(const std::string& recording_id) {
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto                        it = cache_.find(recording_id);
    if (it != cache_.end()) {
      return it->second;
    }
  }

  const auto path = ManifestPath(root_, recording_id);

  // an interrupted write leaves only the temp file behind
  std::error_code ignored;
  std::filesystem::remove(util::TempPathFor(path), ignored);

  if (!std::filesystem::exists(path)) {
    throw util::NotFound("manifest not found: " + recording_id);
  }

  auto manifest = DecodeJson(ReadFile(path));
  if (manifest.recording_id != recording_id) {
    throw std::runtime_error("manifest " + path.string() + " belongs to recording " + manifest.recording_id);
  }

  if (const auto reset = ResetUploading(manifest); reset > 0) {
    PersistLocked(manifest);
    RECSYNC_LOG_INFO("reconciled in-flight chunks",
                     {observability::StringField("recording_id", recording_id), observability::IntField("reset", reset)});
  }

  Publish(manifest);
  return manifest;
}

Manifest ManifestStore::Create(const std::string& recording_id) {
  storage::common::ValidateRecordingId(recording_id);
  auto                        recording_mutex = RecordingMutex(recording_id);
  std::lock_guard<std::mutex> lock(*recording_mutex);

  {
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    if (cache_.count(recording_id) > 0) {
      throw util::AlreadyExists("manifest already exists: " + recording_id);
    }
  }
  if (std::filesystem::exists(ManifestPath(root_, recording_id))) {
    throw util::AlreadyExists("manifest already exists: " + recording_id);
  }

  Manifest manifest;
  manifest.recording_id = recording_id;
  manifest.created_at   = util::Now();
  PersistLocked(manifest);
  Publish(manifest);

  RECSYNC_LOG_INFO("manifest created", {observability::StringField("recording_id", recording_id)});
  return manifest;
}

Manifest ManifestStore::AppendOrUpdate(const std::string& recording_id, const ChunkEntry& entry) {
  return AppendOrUpdate(recording_id, entry.index, [&entry] { return entry; });
}

Manifest ManifestStore::AppendOrUpdate(const std::string& recording_id, uint32_t index, const EntryFactory& make_entry) {
  auto                        recording_mutex = RecordingMutex(recording_id);
  std::lock_guard<std::mutex> lock(*recording_mutex);

  auto  manifest = LoadLocked(recording_id);
  auto* existing = manifest.Find(index);
  if (existing) {
    if (existing->status == ChunkStatus::kUploading) {
      throw util::InvalidState("chunk " + std::to_string(index) + " of " + recording_id + " is being uploaded");
    }
  } else {
    for (const auto& chunk : manifest.chunks) {
      if (chunk.index >= index) {
        throw util::InvalidState("chunk index " + std::to_string(index) + " is not greater than existing index " +
                                 std::to_string(chunk.index) + " in recording " + recording_id);
      }
    }
  }

  auto entry = make_entry();
  if (entry.index != index) {
    throw std::invalid_argument("entry index " + std::to_string(entry.index) + " does not match " + std::to_string(index));
  }
  if (existing) {
    *existing = std::move(entry);
  } else {
    manifest.chunks.push_back(std::move(entry));
  }

  PersistLocked(manifest);
  Publish(manifest);
  return manifest;
}

Manifest ManifestStore::Load(const std::string& recording_id) {
  storage::common::ValidateRecordingId(recording_id);
  auto                        recording_mutex = RecordingMutex(recording_id);
  std::lock_guard<std::mutex> lock(*recording_mutex);
  return LoadLocked(recording_id);
}

std::vector<Manifest> ManifestStore::LoadAll() {
  std::vector<std::string> recording_ids;

  std::error_code ec;
  for (const auto& dirent : std::filesystem::directory_iterator(root_, ec)) {
    const auto& path = dirent.path();
    if (!dirent.is_regular_file() || path.extension() != ".json") {
      continue;
    }
    recording_ids.push_back(path.stem().string());
  }
  if (ec) {
    RECSYNC_LOG_ERROR("manifest directory scan failed", {observability::StringField("dir", root_.string()), observability::StringField("error", ec.message())});
  }

  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    for (const auto& [recording_id, manifest] : cache_) {
      if (std::find(recording_ids.begin(), recording_ids.end(), recording_id) == recording_ids.end()) {
        recording_ids.push_back(recording_id);
      }
    }
  }

  std::sort(recording_ids.begin(), recording_ids.end());

  std::vector<Manifest> manifests;
  manifests.reserve(recording_ids.size());
  for (const auto& recording_id : recording_ids) {
    try {
      manifests.push_back(Load(recording_id));
    } catch (const util::NotFound&) {
      // deleted concurrently
    } catch (const std::exception& e) {
      RECSYNC_LOG_ERROR("skipping unreadable manifest",
                        {observability::StringField("recording_id", recording_id), observability::StringField("error", e.what())});
    }
  }
  return manifests;
}

bool ManifestStore::Exists(const std::string& recording_id) {
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (cache_.count(recording_id) > 0) {
      return true;
    }
  }
  return std::filesystem::exists(ManifestPath(root_, recording_id));
}

ChunkEntry ManifestStore::Update(const std::string& recording_id, uint32_t index, const Mutator& mutator) {
  auto                        recording_mutex = RecordingMutex(recording_id);
  std::lock_guard<std::mutex> lock(*recording_mutex);

  auto  manifest = LoadLocked(recording_id);
  auto& entry    = FindOrThrow(manifest, index);

  const auto previous = entry.status;
  mutator(entry);
  if (entry.index != index) {
    throw util::InvalidState("chunk index must not change during update");
  }
  if (!model::CanTransition(previous, entry.status)) {
    throw util::InvalidState("invalid chunk transition " + std::string(model::ToString(previous)) + " -> " +
                             std::string(model::ToString(entry.status)) + " for " + recording_id + "/" + std::to_string(index));
  }

  const auto updated = entry;
  PersistLocked(manifest);
  Publish(manifest);
  return updated;
}

ChunkEntry ManifestStore::Resubmit(const std::string& recording_id, uint32_t index) {
  return Update(recording_id, index, [&](ChunkEntry& entry) {
    if (entry.status != ChunkStatus::kFailed) {
      throw util::InvalidState("only failed chunks can be resubmitted; chunk " + std::to_string(index) + " is " +
                               std::string(model::ToString(entry.status)));
    }
    entry.status             = ChunkStatus::kPending;
    entry.retry_count        = 0;
    entry.integrity_failures = 0;
    entry.last_attempt_at.reset();
    entry.last_error.reset();
  });
}

uint32_t ManifestStore::ResubmitFailed(const std::string& recording_id) {
  auto                        recording_mutex = RecordingMutex(recording_id);
  std::lock_guard<std::mutex> lock(*recording_mutex);

  auto     manifest    = LoadLocked(recording_id);
  uint32_t resubmitted = 0;
  for (auto& entry : manifest.chunks) {
    if (entry.status != ChunkStatus::kFailed) {
      continue;
    }
    entry.status             = ChunkStatus::kPending;
    entry.retry_count        = 0;
    entry.integrity_failures = 0;
    entry.last_attempt_at.reset();
    entry.last_error.reset();
    ++resubmitted;
  }

  if (resubmitted > 0) {
    PersistLocked(manifest);
    Publish(manifest);
  }
  return resubmitted;
}

ChunkEntry ManifestStore::Cancel(const std::string& recording_id, uint32_t index) {
  return Update(recording_id, index, [&](ChunkEntry& entry) {
    if (!model::CanTransition(entry.status, ChunkStatus::kCancelled) || entry.status == ChunkStatus::kCancelled) {
      throw util::InvalidState("chunk " + std::to_string(index) + " cannot be cancelled while " + std::string(model::ToString(entry.status)));
    }
    entry.status = ChunkStatus::kCancelled;
  });
}

void ManifestStore::Delete(const std::string& recording_id) {
  storage::common::ValidateRecordingId(recording_id);
  auto                        recording_mutex = RecordingMutex(recording_id);
  std::lock_guard<std::mutex> lock(*recording_mutex);

  const auto path    = ManifestPath(root_, recording_id);
  const bool removed = std::filesystem::remove(path);

  bool was_cached = false;
  {
    std::lock_guard<std::mutex> cache_lock(cache_mutex_);
    was_cached = cache_.erase(recording_id) > 0;
  }

  if (!removed && !was_cached) {
    throw util::NotFound("manifest not found: " + recording_id);
  }
  util::FsyncDirectory(root_);
}

uint32_t ManifestStore::ReconcileInFlight() {
  std::vector<std::string> recording_ids;
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    for (const auto& [recording_id, manifest] : cache_) {
      recording_ids.push_back(recording_id);
    }
  }

  uint32_t total = 0;
  for (const auto& recording_id : recording_ids) {
    auto                        recording_mutex = RecordingMutex(recording_id);
    std::lock_guard<std::mutex> lock(*recording_mutex);
    try {
      auto manifest = LoadLocked(recording_id);
      if (const auto reset = ResetUploading(manifest); reset > 0) {
        PersistLocked(manifest);
        Publish(manifest);
        total += reset;
      }
    } catch (const util::NotFound&) {
      // deleted concurrently
    } catch (const std::exception& e) {
      RECSYNC_LOG_ERROR("reconcile failed", {observability::StringField("recording_id", recording_id), observability::StringField("error", e.what())});
    }
  }

  if (total > 0) {
    RECSYNC_LOG_INFO("reconciled in-flight chunks", {observability::IntField("reset", total)});
  }
  return total;
}

} // namespace recsync::manifest
