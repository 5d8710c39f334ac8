#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace recsync::credentials {

/*
  Short-lived object store credentials.
  `expires_at` unset means the credential does not expire.
*/
struct Credentials {
  std::string                    access_key_id;
  std::string                    secret_access_key;
  std::string                    session_token;
  std::optional<util::TimePoint> expires_at;

  bool operator==(const Credentials& other) const {
    return access_key_id == other.access_key_id && secret_access_key == other.secret_access_key && session_token == other.session_token &&
           expires_at == other.expires_at;
  }
  bool operator!=(const Credentials& other) const {
    return !(*this == other);
  }
};

/*
  Source of credentials, injected into the credential cache.
  Implementations throw on failure; callers treat that as a retryable
  authorization failure.
*/
class CredentialProvider {
 public:
  virtual ~CredentialProvider() = default;

  virtual Credentials GetCredentials() = 0;
};

using CredentialProviderPtr = std::shared_ptr<CredentialProvider>;

} // namespace recsync::credentials
