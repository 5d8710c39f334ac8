#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "internal/credentials/credential_cache.hpp"
#include "storage_factory.hpp"

namespace recsync::storage {

/*
  Hands out the object store bound to the current credential.

  The store is rebuilt when the credential cache refreshed since the
  last call; an authorization failure calls InvalidateCredentials() so
  the next Acquire() fetches a fresh credential.
*/
class ObjectStoreProvider {
 public:
  ObjectStoreProvider(std::shared_ptr<credentials::CredentialCache> credentials, StorageFactory::ObjectStoreFactory factory);

  // Throws util::AuthorizationExpired or the factory's upload error.
  ObjectStorePtr Acquire();

  void InvalidateCredentials();

 private:
  std::shared_ptr<credentials::CredentialCache> credentials_;
  StorageFactory::ObjectStoreFactory            factory_;

  std::mutex     mutex_;
  ObjectStorePtr store_;
  uint64_t       generation_ = 0;
};

} // namespace recsync::storage
