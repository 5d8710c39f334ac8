#include "upload_worker.hpp"

#include "internal/observability/logging.hpp"

namespace recsync::upload {

UploadWorker::UploadWorker(std::shared_ptr<UploadQueue> queue, Handler handler) : queue_(std::move(queue)), handler_(std::move(handler)) {
}

UploadWorker::~UploadWorker() {
  Stop();
}

void UploadWorker::Start() {
  if (thread_.joinable()) return;
  thread_ = std::thread(&UploadWorker::Run, this);
}

void UploadWorker::Stop() {
  queue_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

/*
  Runs until the queue is shut down and empty, so a task dequeued before
  Stop() always finishes.
*/
void UploadWorker::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      handler_(*task);
    } catch (const std::exception& e) {
      RECSYNC_LOG_ERROR("upload worker task failed", {observability::StringField("recording_id", task->recording_id),
                                                      observability::IntField("chunk_index", task->index),
                                                      observability::StringField("error", e.what())});
    }
  }
}

} // namespace recsync::upload
