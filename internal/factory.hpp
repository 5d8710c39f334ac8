#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/config/settings.hpp"
#include "internal/credentials/credential_provider.hpp"
#include "internal/storage/storage_factory.hpp"

namespace recsync::manifest { class ManifestStore; }
namespace recsync::upload { class UploadScheduler; }
namespace recsync::service { class UploadService; }

namespace recsync::factory {

/*
  Application

  Owns all long-lived components used by the agent.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  config::Settings settings;

  std::shared_ptr<manifest::ManifestStore>  manifests;
  std::shared_ptr<upload::UploadScheduler>  scheduler;
  std::shared_ptr<service::UploadService>   upload_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire pipeline from runtime config. The scheduler is
  built but not started.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store, credential and
  catalog types.
*/
Application Build(const recsync::runtime::config::RuntimeConfig& config);

// Same graph over a caller-supplied object store backend.
Application Build(const recsync::runtime::config::RuntimeConfig& config, storage::StorageFactory::ObjectStoreFactory store_factory);

// Static, file-backed, or empty (anonymous / local filesystem) credentials.
credentials::CredentialProviderPtr BuildCredentialProvider(const recsync::runtime::config::CredentialsConfig& config);

} // namespace recsync::factory
