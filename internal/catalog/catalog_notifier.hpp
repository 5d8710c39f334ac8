#pragma once

#include <memory>

#include "recsync/uploader/v1.hpp"

namespace recsync::catalog {

/*
  Receives one event per chunk reaching a terminal state
  (completed, failed, cancelled).

  Implementations may throw; the caller logs the failure and the chunk
  state is left untouched.
*/
class CatalogNotifier {
 public:
  virtual ~CatalogNotifier() = default;

  virtual void Notify(const recsync::uploader::v1::ChunkEvent& event) = 0;
};

using CatalogNotifierPtr = std::shared_ptr<CatalogNotifier>;

class LoggingCatalogNotifier final : public CatalogNotifier {
 public:
  void Notify(const recsync::uploader::v1::ChunkEvent& event) override;
};

} // namespace recsync::catalog
