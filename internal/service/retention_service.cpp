#include "retention_service.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/batch_store.hpp"
#include "internal/util/time.hpp"

namespace vigil::service {

using vigil::observability::IntField;
using vigil::observability::StringField;

namespace {

constexpr std::chrono::seconds kMinimumTtl{60};

} // namespace

RetentionService::Options RetentionService::OptionsFromConfig(const vigil::runtime::config::RetentionConfig& config) {
  Options options;
  if (config.batch_ttl_seconds() > 0) {
    options.batch_ttl = std::max(std::chrono::seconds(config.batch_ttl_seconds()), kMinimumTtl);
  }
  if (config.sweep_interval_ms() > 0) {
    options.sweep_interval = std::chrono::milliseconds(config.sweep_interval_ms());
  }
  options.dry_run = config.dry_run();
  return options;
}

RetentionService::RetentionService(std::shared_ptr<db::Repository> repository,
                                   std::shared_ptr<storage::BatchStore> batch_store, Options options)
    : repo_(std::move(repository)), store_(std::move(batch_store)), options_(options) {
  if (!repo_ || !store_) {
    throw std::invalid_argument("RetentionService: repository and batch store are required");
  }
}

RetentionService::~RetentionService() {
  Stop();
}

bool RetentionService::RemoveOne(const std::string& storage_key, RetentionReport& report) {
  try {
    if (store_->Exists(storage_key)) {
      store_->Remove(storage_key);
      ++report.objects_removed;
    }
  } catch (const std::exception& e) {
    VIGIL_LOG_WARN("expired batch object not removed",
                   {StringField("storage_key", storage_key), StringField("error", e.what())});
    return false;
  }

  auto tx = repo_->Begin();
  auto r  = repo_->DeleteBatch(*tx, storage_key);
  if (r.code == db::ErrorCode::NotFound) {
    // removed concurrently
    tx->Rollback();
    return true;
  }
  if (!r) {
    VIGIL_LOG_WARN("expired batch entry not removed",
                   {StringField("storage_key", storage_key), StringField("error", r.message)});
    tx->Rollback();
    return false;
  }
  tx->Commit();
  ++report.rows_removed;
  return true;
}

RetentionReport RetentionService::SweepOnce(int64_t now_ms) {
  const int64_t cutoff_ms = now_ms - std::chrono::duration_cast<std::chrono::milliseconds>(options_.batch_ttl).count();

  std::vector<db::model::BatchIndexRecord> expired;
  {
    auto tx = repo_->Begin();
    expired = repo_->ListBatchesIngestedBefore(*tx, cutoff_ms, options_.max_per_sweep);
    tx->Commit();
  }

  RetentionReport report;
  for (const auto& entry : expired) {
    ++report.examined;
    if (options_.dry_run) {
      VIGIL_LOG_INFO("expired batch (dry run)", {StringField("storage_key", entry.storage_key),
                                                 IntField("ingested_at_ms", entry.ingested_at_ms)});
      continue;
    }
    if (!RemoveOne(entry.storage_key, report)) {
      ++report.failed;
    }
  }

  if (report.examined > 0) {
    VIGIL_LOG_INFO("retention sweep", {IntField("examined", static_cast<int64_t>(report.examined)),
                                       IntField("objects_removed", static_cast<int64_t>(report.objects_removed)),
                                       IntField("rows_removed", static_cast<int64_t>(report.rows_removed)),
                                       IntField("failed", static_cast<int64_t>(report.failed)),
                                       observability::BoolField("dry_run", options_.dry_run)});
  }
  return report;
}

void RetentionService::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&RetentionService::Run, this);
}

void RetentionService::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void RetentionService::Run() {
  while (running_) {
    try {
      SweepOnce(util::NowUnixMillis());
    } catch (const std::exception& e) {
      VIGIL_LOG_ERROR("retention sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, options_.sweep_interval, [this] { return !running_; });
  }
}

} // namespace vigil::service
