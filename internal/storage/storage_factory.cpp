#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "internal/observability/logging.hpp"
#include "object/arrow_object_store.hpp"

namespace recsync::storage {

StorageFactory::ObjectStoreFactory StorageFactory::Build(const recsync::runtime::config::ObjectStoreConfig& cfg) {
  return [cfg](const credentials::Credentials& credentials) -> ObjectStorePtr {
    auto resolved = common::ResolveFileSystem(cfg, credentials);
    if (!resolved.ok()) {
      common::ThrowUploadError(resolved.status(), "resolve object store " + cfg.root());
    }
    auto [fs, root] = std::move(resolved).ValueOrDie();

    RECSYNC_LOG_INFO("object store ready", {observability::StringField("filesystem", fs->type_name()), observability::StringField("root", root)});
    return std::make_shared<ArrowObjectStore>(std::move(fs), std::move(root));
  };
}

} // namespace recsync::storage
