#pragma once

#include <memory>

namespace recsync::chunk { class ChunkWriter; }
namespace recsync::manifest { class ManifestStore; }
namespace recsync::upload { class UploadScheduler; }
namespace recsync::catalog { class CatalogNotifier; }

namespace recsync::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<recsync::chunk::ChunkWriter>       writer;
  std::shared_ptr<recsync::manifest::ManifestStore>  manifests;
  std::shared_ptr<recsync::upload::UploadScheduler>  scheduler;
  std::shared_ptr<recsync::catalog::CatalogNotifier> notifier;
};

}
