#include "catalog_notifier.hpp"
#include "internal/observability/logging.hpp"

namespace recsync::catalog {

void LoggingCatalogNotifier::Notify(const recsync::uploader::v1::ChunkEvent& event) {
  RECSYNC_LOG_INFO("catalog event", {observability::StringField("recording_id", event.recording_id()),
                                     observability::IntField("chunk_index", event.chunk_index()), observability::StringField("status", event.status()),
                                     observability::StringField("remote_key", event.remote_key()),
                                     observability::StringField("error", event.error())});
}

} // namespace recsync::catalog
