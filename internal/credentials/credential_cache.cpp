#include "credential_cache.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace recsync::credentials {

CredentialCache::CredentialCache(CredentialProviderPtr provider, std::chrono::milliseconds refresh_before_expiry)
    : provider_(std::move(provider)), refresh_before_expiry_(refresh_before_expiry) {
  if (!provider_) {
    throw std::invalid_argument("credential provider is required");
  }
}

bool CredentialCache::NeedsRefreshLocked(util::TimePoint now) const {
  if (!cached_ || invalidated_) {
    return true;
  }
  if (!cached_->expires_at) {
    return false;
  }
  return *cached_->expires_at - now <= refresh_before_expiry_;
}

CredentialCache::Snapshot CredentialCache::Get() {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto now = util::Now();
  if (!NeedsRefreshLocked(now)) {
    return {*cached_, generation_};
  }

  try {
    auto fresh = provider_->GetCredentials();
    if (fresh.expires_at && *fresh.expires_at <= now) {
      throw std::runtime_error("provider returned an already expired credential");
    }
    cached_      = std::move(fresh);
    invalidated_ = false;
    ++generation_;
    RECSYNC_LOG_INFO("credentials refreshed", {observability::IntField("generation", static_cast<int64_t>(generation_)),
                                               observability::BoolField("expiring", cached_->expires_at.has_value())});
    return {*cached_, generation_};
  } catch (const std::exception& e) {
    // keep serving a still-valid credential during proactive refresh
    if (cached_ && !invalidated_ && (!cached_->expires_at || *cached_->expires_at > now)) {
      RECSYNC_LOG_WARN("credential refresh failed, using cached credential", {observability::StringField("error", e.what())});
      return {*cached_, generation_};
    }
    throw util::AuthorizationExpired(std::string("credential refresh failed: ") + e.what());
  }
}

void CredentialCache::Invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  invalidated_ = true;
}

} // namespace recsync::credentials
