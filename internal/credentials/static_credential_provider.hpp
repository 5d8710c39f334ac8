#pragma once

#include <utility>

#include "credential_provider.hpp"

namespace recsync::credentials {

// Fixed, non-expiring credentials from configuration.
class StaticCredentialProvider final : public CredentialProvider {
 public:
  explicit StaticCredentialProvider(Credentials credentials) : credentials_(std::move(credentials)) {
  }

  Credentials GetCredentials() override {
    return credentials_;
  }

 private:
  Credentials credentials_;
};

} // namespace recsync::credentials
