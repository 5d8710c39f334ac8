#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/catalog/catalog_notifier.hpp"
#include "internal/catalog/outbox_catalog_notifier.hpp"
#include "internal/chunk/chunk_writer.hpp"
#include "internal/credentials/credential_cache.hpp"
#include "internal/credentials/file_credential_provider.hpp"
#include "internal/credentials/static_credential_provider.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/manifest/manifest_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/upload_service.hpp"
#include "internal/storage/object_store_provider.hpp"
#include "internal/upload/upload_scheduler.hpp"

namespace recsync::factory {

using observability::StringField;

credentials::CredentialProviderPtr BuildCredentialProvider(const recsync::runtime::config::CredentialsConfig& config) {
  if (config.has_file()) {
    return std::make_shared<credentials::FileCredentialProvider>(config.file().path());
  }

  credentials::Credentials static_credentials;
  if (config.has_static_credentials()) {
    static_credentials.access_key_id     = config.static_credentials().access_key_id();
    static_credentials.secret_access_key = config.static_credentials().secret_access_key();
    static_credentials.session_token     = config.static_credentials().session_token();
  }
  return std::make_shared<credentials::StaticCredentialProvider>(std::move(static_credentials));
}

Application Build(const recsync::runtime::config::RuntimeConfig& config) {
  return Build(config, storage::StorageFactory::Build(config.object_store()));
}

/*
    Build full application dependency graph
*/
Application Build(const recsync::runtime::config::RuntimeConfig& config, storage::StorageFactory::ObjectStoreFactory store_factory) {
  Application app;
  app.settings = recsync::config::ResolveSettings(config);

  // ------------------------------------------------------------------
  // Object store access
  // ------------------------------------------------------------------
  auto credential_cache = std::make_shared<credentials::CredentialCache>(BuildCredentialProvider(config.credentials()),
                                                                         app.settings.refresh_before_expiry);
  auto stores           = std::make_shared<storage::ObjectStoreProvider>(credential_cache, std::move(store_factory));

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto writer = std::make_shared<chunk::ChunkWriter>(app.settings.capture);
  app.manifests = std::make_shared<manifest::ManifestStore>(app.settings.manifest_dir);

  catalog::CatalogNotifierPtr notifier;
  if (app.settings.outbox_path.empty()) {
    notifier = std::make_shared<catalog::LoggingCatalogNotifier>();
  } else {
    notifier = std::make_shared<catalog::OutboxCatalogNotifier>(app.settings.outbox_path);
    RECSYNC_LOG_INFO("catalog outbox enabled", {StringField("path", app.settings.outbox_path)});
  }

  // ------------------------------------------------------------------
  // Upload system
  // ------------------------------------------------------------------
  app.scheduler =
      std::make_shared<upload::UploadScheduler>(app.manifests, stores, notifier, app.settings.upload, app.settings.transfer);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.writer    = writer;
  ctx.manifests = app.manifests;
  ctx.scheduler = app.scheduler;
  ctx.notifier  = notifier;

  app.upload_service = std::make_shared<service::UploadService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<recsync::grpc::AdminServer>(app.upload_service));

  return app;
}

} // namespace recsync::factory
