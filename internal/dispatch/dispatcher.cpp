#include "dispatcher.hpp"

#include <algorithm>
#include <optional>

#include "config/config.pb.h"
#include "internal/codec/batch_transform.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace vigil::dispatch {

using vigil::observability::IntField;
using vigil::observability::StringField;

namespace {

constexpr std::chrono::milliseconds kRouterPoll{200};

std::vector<std::string> CategoryNames(model::CategoryMask mask) {
  std::vector<std::string> out;
  for (auto c : {model::EventCategory::kOther, model::EventCategory::kState, model::EventCategory::kMovement,
                 model::EventCategory::kCombat, model::EventCategory::kBlock, model::EventCategory::kInventory,
                 model::EventCategory::kDev}) {
    if (mask & model::MaskOf(c)) {
      out.emplace_back(model::ToString(c));
    }
  }
  return out;
}

} // namespace

Dispatcher::Options Dispatcher::OptionsFromConfig(const vigil::runtime::config::DispatchConfig& config) {
  Options options;
  if (config.router_capacity() > 0) options.router_capacity = config.router_capacity();
  if (config.lane_capacity() > 0) options.lane_capacity = config.lane_capacity();
  if (config.default_timeout_ms() > 0) options.default_timeout = std::chrono::milliseconds(config.default_timeout_ms());
  return options;
}

Dispatcher::Dispatcher(std::shared_ptr<ModuleRegistry> registry, std::shared_ptr<db::Repository> repository,
                       ModuleClientFactory client_factory, Options options)
    : registry_(std::move(registry)),
      repo_(std::move(repository)),
      client_factory_(std::move(client_factory)),
      options_(options),
      router_queue_(options.router_capacity, capture::OverflowPolicy::kDropNewest) {
  if (!registry_ || !repo_ || !client_factory_) {
    throw std::invalid_argument("Dispatcher: registry, repository and client factory are required");
  }
}

Dispatcher::~Dispatcher() {
  Stop();
}

void Dispatcher::Start() {
  if (started_.exchange(true)) return;
  router_ = std::thread(&Dispatcher::RouterLoop, this);
}

void Dispatcher::Stop() {
  router_queue_.Shutdown();
  if (router_.joinable()) {
    router_.join();
  }

  std::map<std::string, std::shared_ptr<ModuleLane>> lanes;
  {
    std::lock_guard lock(lanes_mutex_);
    lanes.swap(lanes_);
  }
  for (auto& [_, lane] : lanes) {
    lane->Stop();
  }
}

bool Dispatcher::Enqueue(IndexedBatch batch) {
  const auto key = batch.entry.storage_key;
  if (!router_queue_.TryEnqueue(std::move(batch))) {
    ++rejected_;
    VIGIL_LOG_WARN("dispatch router full; batch left indexed", {StringField("storage_key", key)});
    return false;
  }
  return true;
}

void Dispatcher::ReloadModules(std::vector<ModuleSpec> modules, std::vector<model::ModuleTier> enabled_tiers) {
  std::vector<std::shared_ptr<ModuleLane>> retired;
  {
    std::lock_guard lock(lanes_mutex_);
    for (auto it = lanes_.begin(); it != lanes_.end();) {
      // lane specs already carry the effective timeout
      const auto& current = it->second->Spec();
      const auto  match   = std::find_if(modules.begin(), modules.end(), [&](const ModuleSpec& m) {
        return m.name == current.name && m.endpoint == current.endpoint && EffectiveTimeout(m) == current.timeout;
      });
      if (match == modules.end()) {
        retired.push_back(std::move(it->second));
        it = lanes_.erase(it);
      } else {
        ++it;
      }
    }
    registry_->Replace(std::move(modules), std::move(enabled_tiers));
  }

  for (auto& lane : retired) {
    lane->Stop();
  }
  VIGIL_LOG_INFO("module set reloaded", {IntField("retired_lanes", static_cast<int64_t>(retired.size()))});
}

DispatcherStats Dispatcher::Stats() const {
  DispatcherStats s;
  s.routed   = routed_.load();
  s.rejected = rejected_.load();
  s.sent     = sent_.load();
  s.failed   = failed_.load();
  s.skipped  = skipped_.load();
  s.dropped  = dropped_.load();
  return s;
}

void Dispatcher::RouterLoop() {
  for (;;) {
    // one at a time; a lone batch must not wait out the poll interval
    auto batches = router_queue_.DrainBatch(1, kRouterPoll);
    if (batches.empty()) {
      if (router_queue_.IsShutdown()) break;
      continue;
    }
    for (const auto& batch : batches) {
      try {
        Route(batch);
      } catch (const std::exception& e) {
        VIGIL_LOG_ERROR("dispatch routing failed",
                        {StringField("storage_key", batch.entry.storage_key), StringField("error", e.what())});
      }
    }
  }
}

std::chrono::milliseconds Dispatcher::EffectiveTimeout(const ModuleSpec& spec) const {
  return spec.timeout.count() > 0 ? spec.timeout : options_.default_timeout;
}

std::shared_ptr<ModuleLane> Dispatcher::LaneFor(const ModuleSpec& spec) {
  std::lock_guard lock(lanes_mutex_);
  auto            it = lanes_.find(spec.name);
  if (it != lanes_.end()) {
    return it->second;
  }

  ModuleSpec effective = spec;
  effective.timeout    = EffectiveTimeout(spec);
  auto lane            = std::make_shared<ModuleLane>(
      std::move(effective), client_factory_(spec), options_.lane_capacity,
      [this](const ModuleSpec& s, const DispatchJob& job, const ::grpc::Status& status) { OnLaneDone(s, job, status); });
  lane->Start();
  lanes_.emplace(spec.name, lane);
  return lane;
}

void Dispatcher::Route(const IndexedBatch& batch) {
  ++routed_;
  const auto& entry   = batch.entry;
  const auto  modules = registry_->Select(batch.categories);
  const auto  now     = util::SteadyNow();

  vigil::pipeline::v1::AnalyzeRequest req;
  req.set_source_id(entry.source_id);
  req.set_session_id(entry.session_id);
  req.set_batch_id(entry.batch_id);
  req.set_storage_key(entry.storage_key);
  req.set_record_count(static_cast<int64_t>(entry.record_count));
  for (auto& name : CategoryNames(batch.categories)) {
    req.add_categories(std::move(name));
  }

  // derived views are built on first use and shared across modules
  std::optional<codec::DecodedBatch>                              raw;
  std::map<codec::BatchTransform, std::shared_ptr<arrow::Buffer>> views;
  auto view_for = [&](codec::BatchTransform transform) -> std::shared_ptr<arrow::Buffer> {
    if (transform == codec::BatchTransform::kRaw || !batch.payload) {
      return batch.payload;
    }
    auto it = views.find(transform);
    if (it != views.end()) {
      return it->second;
    }
    if (!raw) {
      raw = codec::DecodeBatch(
          std::string_view(reinterpret_cast<const char*>(batch.payload->data()), static_cast<size_t>(batch.payload->size())),
          options_.max_decoded_bytes);
    }
    auto view = codec::ApplyTransform(transform, *raw);
    views.emplace(transform, view);
    return view;
  };

  uint32_t dispatched = 0;
  for (const auto& module : modules) {
    if (!registry_->AllowDispatch(module.name, now)) {
      ++skipped_;
      RecordDispatch(entry.storage_key, module.name, db::model::DispatchStatus::kSkipped, "circuit open");
      continue;
    }

    DispatchJob job{entry.storage_key, req};
    job.request.set_transform(std::string(codec::ToString(module.transform)));
    try {
      if (auto view = view_for(module.transform)) {
        job.request.set_payload(view->data(), static_cast<size_t>(view->size()));
      }
    } catch (const std::exception& e) {
      registry_->ReleaseTrial(module.name);
      ++failed_;
      RecordDispatch(entry.storage_key, module.name, db::model::DispatchStatus::kFailed,
                     std::string("transform failed: ") + e.what());
      continue;
    }

    auto lane = LaneFor(module);
    if (!lane->TrySubmit(std::move(job))) {
      registry_->ReleaseTrial(module.name);
      ++dropped_;
      RecordDispatch(entry.storage_key, module.name, db::model::DispatchStatus::kDropped, "module lane full");
      continue;
    }
    ++dispatched;
  }

  auto tx = repo_->Begin();
  auto r  = repo_->UpdateBatchStatus(*tx, entry.storage_key, db::model::BatchStatus::kDispatched, dispatched);
  if (!r) {
    VIGIL_LOG_WARN("batch status update failed",
                   {StringField("storage_key", entry.storage_key), StringField("error", r.message)});
    tx->Rollback();
    return;
  }
  tx->Commit();

  VIGIL_LOG_DEBUG("batch routed", {StringField("storage_key", entry.storage_key),
                                   IntField("candidates", static_cast<int64_t>(modules.size())),
                                   IntField("dispatched", dispatched)});
}

void Dispatcher::OnLaneDone(const ModuleSpec& spec, const DispatchJob& job, const ::grpc::Status& status) {
  if (status.ok()) {
    ++sent_;
    registry_->RecordSuccess(spec.name);
    RecordDispatch(job.storage_key, spec.name, db::model::DispatchStatus::kSent, "");
    return;
  }

  ++failed_;
  registry_->RecordFailure(spec.name, util::SteadyNow());
  VIGIL_LOG_WARN("module call failed", {StringField("module", spec.name), StringField("storage_key", job.storage_key),
                                        IntField("code", static_cast<int64_t>(status.error_code())),
                                        StringField("error", status.error_message())});
  RecordDispatch(job.storage_key, spec.name, db::model::DispatchStatus::kFailed, status.error_message());
}

void Dispatcher::RecordDispatch(const std::string& storage_key, const std::string& module,
                                db::model::DispatchStatus status, const std::string& error) {
  observability::Metrics::Instance().RecordDispatch(module, db::model::ToString(status));

  db::model::DispatchRecord record;
  record.storage_key   = storage_key;
  record.module        = module;
  record.status        = status;
  record.error         = error;
  record.created_at_ms = util::NowUnixMillis();

  try {
    auto tx = repo_->Begin();
    auto r  = repo_->InsertDispatch(*tx, record);
    if (!r) {
      VIGIL_LOG_WARN("dispatch record not written", {StringField("storage_key", storage_key),
                                                     StringField("module", module), StringField("error", r.message)});
      tx->Rollback();
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    VIGIL_LOG_WARN("dispatch record not written",
                   {StringField("storage_key", storage_key), StringField("module", module), StringField("error", e.what())});
  }
}

} // namespace vigil::dispatch
