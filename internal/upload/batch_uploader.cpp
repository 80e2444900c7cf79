#include "batch_uploader.hpp"

#include <algorithm>
#include <iterator>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/spool/durable_spool.hpp"
#include "internal/util/errors.hpp"

namespace vigil::upload {

BatchUploader::BatchUploader(std::shared_ptr<spool::DurableSpool> spool, std::shared_ptr<IngestClient> client,
                             std::chrono::milliseconds timeout, uint32_t max_transient_attempts)
    : spool_(std::move(spool)),
      client_(std::move(client)),
      timeout_(timeout),
      max_transient_attempts_(max_transient_attempts > 0 ? max_transient_attempts : kDefaultMaxTransientAttempts) {
}

UploadReport BatchUploader::UploadPending() {
  // the worker and a manual flush may race
  std::lock_guard lock(mutex_);
  UploadReport    report;
  auto&           metrics = observability::Metrics::Instance();

  const auto pending = spool_->ListPublished();

  // forget counters of files that are gone
  for (auto it = transient_failures_.begin(); it != transient_failures_.end();) {
    const auto listed = std::any_of(pending.begin(), pending.end(),
                                    [&](const spool::SpoolFileHandle& h) { return h.batch_id == it->first; });
    it                = listed ? std::next(it) : transient_failures_.erase(it);
  }

  // a file past its attempt budget, set aside until a later file shows the
  // backend is reachable
  std::optional<spool::SpoolFileHandle> suspect;

  for (std::size_t i = 0; i < pending.size(); ++i) {
    const auto& handle = pending[i];

    std::shared_ptr<arrow::Buffer> payload;
    try {
      payload = spool_->Read(handle);
    } catch (const util::NotFound&) {
      continue;
    } catch (const std::exception& e) {
      VIGIL_LOG_ERROR("Unreadable spool file", {observability::StringField("batch_id", handle.batch_id),
                                                observability::StringField("error", e.what())});
      if (spool_->Quarantine(handle)) ++report.quarantined;
      continue;
    }

    ++report.attempted;
    const auto outcome = client_->Upload(handle.batch_id, payload, timeout_);
    metrics.RecordUpload(ToString(outcome.result));

    switch (outcome.result) {
      case UploadResult::kAccepted:
        transient_failures_.erase(handle.batch_id);
        spool_->Remove(handle);
        ++report.uploaded;
        VIGIL_LOG_DEBUG("Uploaded batch", {observability::StringField("batch_id", handle.batch_id),
                                           observability::StringField("storage_key", outcome.storage_key),
                                           observability::BoolField("duplicate", outcome.duplicate)});
        if (suspect) {
          VIGIL_LOG_ERROR("Upload kept failing while later batches succeed, quarantining",
                          {observability::StringField("batch_id", suspect->batch_id),
                           observability::IntField("attempts", static_cast<int64_t>(transient_failures_[suspect->batch_id]))});
          transient_failures_.erase(suspect->batch_id);
          if (spool_->Quarantine(*suspect)) ++report.quarantined;
          suspect.reset();
        }
        break;

      case UploadResult::kTransient: {
        const auto failures = ++transient_failures_[handle.batch_id];
        if (failures >= max_transient_attempts_ && !suspect) {
          // try the next file before blaming this one
          suspect = handle;
          continue;
        }
        report.retained = pending.size() - i + (suspect ? 1 : 0);
        VIGIL_LOG_WARN("Upload failed, will retry", {observability::StringField("batch_id", handle.batch_id),
                                                     observability::StringField("error", outcome.message),
                                                     observability::IntField("retained", static_cast<int64_t>(report.retained)),
                                                     observability::IntField("attempts", static_cast<int64_t>(failures))});
        return report;
      }

      case UploadResult::kPermanent:
        transient_failures_.erase(handle.batch_id);
        VIGIL_LOG_ERROR("Upload rejected permanently", {observability::StringField("batch_id", handle.batch_id),
                                                        observability::StringField("error", outcome.message)});
        if (spool_->Quarantine(handle)) ++report.quarantined;
        break;
    }
  }

  if (suspect) {
    // nothing behind it proved the backend healthy
    report.retained = 1;
  }
  return report;
}

} // namespace vigil::upload
