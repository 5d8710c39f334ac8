#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/chunk.hpp"

namespace recsync::manifest {

/*
  Durable per-recording upload manifests.

  Layout:

      <root>/<recording_id>.json

  Every mutation runs under the recording's lock as
  load → mutate copy → persist (tmp, fsync, rename, fsync dir) → publish,
  so the cached copy never runs ahead of the file.

  A manifest loaded for the first time in this process has every
  `uploading` entry put back to `pending`.
*/
class ManifestStore {
 public:
  using Mutator      = std::function<void(model::ChunkEntry&)>;
  using EntryFactory = std::function<model::ChunkEntry()>;

  explicit ManifestStore(std::filesystem::path root);

  // Throws util::AlreadyExists.
  model::Manifest Create(const std::string& recording_id);

  /*
    Replaces the entry with the same index, or appends a new one.
    A new index must be greater than every existing index, and an
    `uploading` entry is never replaced (both util::InvalidState).
    Throws util::NotFound when the manifest does not exist.
  */
  model::Manifest AppendOrUpdate(const std::string& recording_id, const model::ChunkEntry& entry);

  // Same checks, but `make_entry` runs under the recording lock once they pass.
  model::Manifest AppendOrUpdate(const std::string& recording_id, uint32_t index, const EntryFactory& make_entry);

  // Throws util::NotFound.
  model::Manifest Load(const std::string& recording_id);

  // Corrupt manifests are logged and skipped.
  std::vector<model::Manifest> LoadAll();

  bool Exists(const std::string& recording_id);

  /*
    Atomic read-modify-write of one entry. The mutator may throw to abort;
    the resulting status change must be allowed by CanTransition, otherwise
    util::InvalidState and nothing is persisted. Returns the stored entry.
  */
  model::ChunkEntry Update(const std::string& recording_id, uint32_t index, const Mutator& mutator);

  // failed → pending with retry counters reset.
  model::ChunkEntry Resubmit(const std::string& recording_id, uint32_t index);
  uint32_t          ResubmitFailed(const std::string& recording_id);

  // pending | failed → cancelled.
  model::ChunkEntry Cancel(const std::string& recording_id, uint32_t index);

  void Delete(const std::string& recording_id);

  // uploading → pending for every cached manifest; returns entries reset.
  uint32_t ReconcileInFlight();

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::shared_ptr<std::mutex> RecordingMutex(const std::string& recording_id);

  // Caller holds the recording lock.
  model::Manifest LoadLocked(const std::string& recording_id);
  void            PersistLocked(model::Manifest& manifest);
  void            Publish(const model::Manifest& manifest);

  std::filesystem::path root_;

  std::mutex                                       cache_mutex_;
  std::unordered_map<std::string, model::Manifest> cache_;

  std::mutex                                                   recording_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> recording_mutexes_;
};

} // namespace recsync::manifest
