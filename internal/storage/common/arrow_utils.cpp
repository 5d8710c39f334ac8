#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

#include <algorithm>
#include <initializer_list>
#include <cctype>
#include <chrono>
#include <filesystem>

namespace recsync::storage::common {

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const char* needle) { return haystack.find(needle) != std::string::npos; });
}

bool IsS3Root(const std::string& root) {
  return root.rfind("s3://", 0) == 0;
}

double Seconds(const google::protobuf::Duration& d) {
  return static_cast<double>(d.seconds()) + static_cast<double>(d.nanos()) / 1e9;
}

} // namespace

util::UploadErrorKind ClassifyStatus(const arrow::Status& status) {
  const auto message = Lower(status.ToString());

  if (ContainsAny(message, {"access_denied", "accessdenied", "access denied", "http status 401", "http status 403", "expiredtoken",
                            "expired token", "invalidaccesskeyid", "signaturedoesnotmatch", "forbidden", "unauthorized", "credentials"})) {
    return util::UploadErrorKind::kAuthorizationExpired;
  }

  if (status.IsInvalid() || status.IsKeyError() || status.IsNotImplemented() || status.IsTypeError()) {
    return util::UploadErrorKind::kStoreRejected;
  }
  if (ContainsAny(message, {"http status 400", "invalidrequest", "invalidargument", "nosuchbucket", "entitytoolarge", "invalidpart"})) {
    return util::UploadErrorKind::kStoreRejected;
  }

  return util::UploadErrorKind::kNetworkFailure;
}

void ThrowUploadError(const arrow::Status& status, std::string_view context) {
  const auto message = std::string(context) + ": " + status.ToString();
  switch (ClassifyStatus(status)) {
    case util::UploadErrorKind::kAuthorizationExpired:
      throw util::AuthorizationExpired(message);
    case util::UploadErrorKind::kStoreRejected:
      throw util::StoreRejected(message);
    default:
      throw util::NetworkFailure(message);
  }
}

bool UsesS3(const recsync::runtime::config::ObjectStoreConfig& config) {
  return config.kind() == recsync::runtime::config::OBJECT_STORE_KIND_S3 ||
         (config.kind() == recsync::runtime::config::OBJECT_STORE_KIND_AUTO && IsS3Root(config.root()));
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const recsync::runtime::config::ObjectStoreConfig& config, const credentials::Credentials& credentials) {
  const auto& root = config.root();
  if (root.empty()) {
    return arrow::Status::Invalid("object store root is empty");
  }

  if (UsesS3(config)) {
    std::string resolved_path;
    ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(root, &resolved_path));

    const auto& s3 = config.s3();
    if (!s3.region().empty()) options.region = s3.region();
    if (!s3.endpoint_override().empty()) options.endpoint_override = s3.endpoint_override();
    if (!s3.scheme().empty()) options.scheme = s3.scheme();
    if (s3.has_connect_timeout()) options.connect_timeout = Seconds(s3.connect_timeout());
    if (s3.has_request_timeout()) options.request_timeout = Seconds(s3.request_timeout());
    options.force_virtual_addressing = s3.force_virtual_addressing();

    if (!credentials.access_key_id.empty()) {
      options.ConfigureAccessKey(credentials.access_key_id, credentials.secret_access_key, credentials.session_token);
    }

    ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
    return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
  }

  if (root.find("://") != std::string::npos) {
    std::string resolved_path;
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(root, &resolved_path));
    return std::make_pair(std::move(fs), resolved_path);
  }

  std::error_code ec;
  auto            absolute = std::filesystem::absolute(root, ec);
  if (ec) {
    return arrow::Status::IOError("cannot resolve object store root ", root, ": ", ec.message());
  }
  return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), absolute.lexically_normal().string());
}

} // namespace recsync::storage::common
