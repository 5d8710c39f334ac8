#include "object_store_provider.hpp"

#include <stdexcept>

namespace recsync::storage {

ObjectStoreProvider::ObjectStoreProvider(std::shared_ptr<credentials::CredentialCache> credentials, StorageFactory::ObjectStoreFactory factory)
    : credentials_(std::move(credentials)), factory_(std::move(factory)) {
  if (!credentials_ || !factory_) {
    throw std::invalid_argument("object store provider needs a credential cache and a factory");
  }
}

ObjectStorePtr ObjectStoreProvider::Acquire() {
  auto snapshot = credentials_->Get();

  std::lock_guard<std::mutex> lock(mutex_);
  if (!store_ || snapshot.generation != generation_) {
    store_      = factory_(snapshot.credentials);
    generation_ = snapshot.generation;
  }
  return store_;
}

void ObjectStoreProvider::InvalidateCredentials() {
  credentials_->Invalidate();
}

} // namespace recsync::storage
