#pragma once

#include <filesystem>

#include "credential_provider.hpp"

namespace recsync::credentials {

/*
  Re-reads a YAML credentials file on every call. The file is maintained
  by an external auth helper:

      access_key_id: AKIA...
      secret_access_key: ...
      session_token: ...            # optional
      expires_at: 2026-10-18T12:00:00Z   # optional, RFC 3339
*/
class FileCredentialProvider final : public CredentialProvider {
 public:
  explicit FileCredentialProvider(std::filesystem::path path);

  Credentials GetCredentials() override;

 private:
  std::filesystem::path path_;
};

} // namespace recsync::credentials
