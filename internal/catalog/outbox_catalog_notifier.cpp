#include "outbox_catalog_notifier.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <stdexcept>

namespace recsync::catalog {

OutboxCatalogNotifier::OutboxCatalogNotifier(std::filesystem::path path) : path_(std::move(path)) {
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }
}

void OutboxCatalogNotifier::Notify(const recsync::uploader::v1::ChunkEvent& event) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string line;
  auto        status = google::protobuf::util::MessageToJsonString(event, &line, options);
  if (!status.ok()) {
    throw std::runtime_error("catalog event encode failed: " + std::string(status.message()));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream               out(path_, std::ios::app | std::ios::binary);
  out << line << '\n';
  out.flush();
  if (!out) {
    throw std::runtime_error("catalog outbox write failed: " + path_.string());
  }
}

} // namespace recsync::catalog
