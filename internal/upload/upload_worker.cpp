#include "upload_worker.hpp"

#include "batch_uploader.hpp"
#include "internal/observability/logging.hpp"

namespace vigil::upload {

UploadWorker::UploadWorker(std::shared_ptr<BatchUploader> uploader, std::chrono::milliseconds interval)
    : uploader_(std::move(uploader)), interval_(interval) {}

UploadWorker::~UploadWorker() {
  Stop();
}

void UploadWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&UploadWorker::Run, this);
}

void UploadWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void UploadWorker::Run() {
  while (running_) {
    try {
      const auto report = uploader_->UploadPending();
      if (report.attempted > 0) {
        VIGIL_LOG_INFO("Upload pass", {observability::IntField("attempted", static_cast<int64_t>(report.attempted)),
                                       observability::IntField("uploaded", static_cast<int64_t>(report.uploaded)),
                                       observability::IntField("retained", static_cast<int64_t>(report.retained)),
                                       observability::IntField("quarantined", static_cast<int64_t>(report.quarantined))});
      }
    }
    catch (const std::exception& e) {
      VIGIL_LOG_ERROR("Upload pass failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

}
