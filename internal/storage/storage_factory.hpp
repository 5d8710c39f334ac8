#pragma once

#include <functional>

#include "config/config.pb.h"
#include "internal/credentials/credential_provider.hpp"
#include "object_store.hpp"

namespace recsync::storage {

/*
  Builds object store backends from configuration.

  The store is bound to one credential, so callers get a factory and
  rebuild the store whenever the credential changes:

      auto make_store = StorageFactory::Build(config.object_store());
      auto store      = make_store(credentials);
*/
class StorageFactory {
 public:
  using ObjectStoreFactory = std::function<ObjectStorePtr(const credentials::Credentials&)>;

  static ObjectStoreFactory Build(const recsync::runtime::config::ObjectStoreConfig& cfg);
};

} // namespace recsync::storage
