#include "file_credential_provider.hpp"

#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace recsync::credentials {

namespace {

std::string RequiredScalar(const YAML::Node& root, const char* key, const std::filesystem::path& path) {
  const auto node = root[key];
  if (!node || !node.IsScalar() || node.Scalar().empty()) {
    throw std::runtime_error("credentials file " + path.string() + " is missing '" + key + "'");
  }
  return node.Scalar();
}

} // namespace

FileCredentialProvider::FileCredentialProvider(std::filesystem::path path) : path_(std::move(path)) {
}

Credentials FileCredentialProvider::GetCredentials() {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path_.string());
  } catch (const std::exception& e) {
    throw std::runtime_error("failed to read credentials file " + path_.string() + ": " + e.what());
  }
  if (!root.IsMap()) {
    throw std::runtime_error("credentials file " + path_.string() + " must be a mapping");
  }

  Credentials credentials;
  credentials.access_key_id     = RequiredScalar(root, "access_key_id", path_);
  credentials.secret_access_key = RequiredScalar(root, "secret_access_key", path_);
  if (const auto token = root["session_token"]; token && token.IsScalar()) {
    credentials.session_token = token.Scalar();
  }
  if (const auto expires = root["expires_at"]; expires && expires.IsScalar() && !expires.Scalar().empty()) {
    google::protobuf::Timestamp ts;
    if (!google::protobuf::util::TimeUtil::FromString(expires.Scalar(), &ts)) {
      throw std::runtime_error("credentials file " + path_.string() + " has invalid expires_at: " + expires.Scalar());
    }
    credentials.expires_at = util::FromProto(ts);
  }
  return credentials;
}

} // namespace recsync::credentials
