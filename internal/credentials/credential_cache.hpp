#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

#include "credential_provider.hpp"

namespace recsync::credentials {

/*
  Caches the provider's credentials.

  Refreshes when:
    - nothing cached yet
    - Invalidate() was called (authorization failure)
    - the cached credential expires within `refresh_before_expiry`

  Every refresh bumps `generation`, which lets holders of derived
  clients notice that they must be rebuilt.
*/
class CredentialCache {
 public:
  struct Snapshot {
    Credentials credentials;
    uint64_t    generation = 0;
  };

  CredentialCache(CredentialProviderPtr provider, std::chrono::milliseconds refresh_before_expiry);

  // Throws util::AuthorizationExpired when no usable credential can be obtained.
  Snapshot Get();

  void Invalidate();

 private:
  bool NeedsRefreshLocked(util::TimePoint now) const;

  CredentialProviderPtr     provider_;
  std::chrono::milliseconds refresh_before_expiry_;

  std::mutex                 mutex_;
  std::optional<Credentials> cached_;
  bool                       invalidated_ = false;
  uint64_t                   generation_  = 0;
};

} // namespace recsync::credentials
