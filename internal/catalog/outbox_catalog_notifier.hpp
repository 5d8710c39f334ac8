#pragma once

#include <filesystem>
#include <mutex>

#include "catalog_notifier.hpp"

namespace recsync::catalog {

/*
  Appends each event as one JSON line to an outbox file that the
  external catalog ingests:

      {"recording_id":"rec-1","chunk_index":0,"status":"completed",...}
*/
class OutboxCatalogNotifier final : public CatalogNotifier {
 public:
  explicit OutboxCatalogNotifier(std::filesystem::path path);

  void Notify(const recsync::uploader::v1::ChunkEvent& event) override;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  std::mutex            mutex_;
};

} // namespace recsync::catalog
