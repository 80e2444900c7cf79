#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/retention_service.hpp"
#include "internal/storage/batch_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using vigil::db::model::BatchIndexRecord;
using vigil::db::model::DispatchRecord;
using vigil::db::model::DispatchStatus;
using vigil::service::RetentionService;

constexpr int64_t kDay = 24LL * 3600 * 1000;

class MapBatchStore final : public vigil::storage::BatchStore {
 public:
  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override {
    std::lock_guard lock(mutex_);
    objects_[key] = buffer->ToString();
  }

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override {
    std::lock_guard lock(mutex_);
    auto            it = objects_.find(key);
    if (it == objects_.end()) throw vigil::util::NotFound("no object " + key);
    return arrow::Buffer::FromString(it->second);
  }

  bool Exists(const std::string& key) override {
    std::lock_guard lock(mutex_);
    return objects_.contains(key);
  }

  void Remove(const std::string& key) override {
    std::lock_guard lock(mutex_);
    if (undeletable.contains(key)) throw std::runtime_error("permission denied");
    objects_.erase(key);
  }

  std::set<std::string> undeletable;

 private:
  std::mutex                         mutex_;
  std::map<std::string, std::string> objects_;
};

struct Fixture {
  std::shared_ptr<vigil::db::memory::MemoryRepository> repo  = std::make_shared<vigil::db::memory::MemoryRepository>();
  std::shared_ptr<MapBatchStore>                       store = std::make_shared<MapBatchStore>();

  std::string Add(const std::string& batch_id, int64_t ingested_at_ms, bool with_object = true) {
    BatchIndexRecord entry;
    entry.storage_key    = "server-a/boot-1/" + batch_id + ".ndjson.gz";
    entry.batch_id       = batch_id;
    entry.source_id      = "server-a";
    entry.session_id     = "boot-1";
    entry.ingested_at_ms = ingested_at_ms;

    DispatchRecord dispatch;
    dispatch.storage_key   = entry.storage_key;
    dispatch.module        = "speed";
    dispatch.status        = DispatchStatus::kSent;
    dispatch.created_at_ms = ingested_at_ms;

    auto tx = repo->Begin();
    assert(repo->InsertBatch(*tx, entry));
    assert(repo->InsertDispatch(*tx, dispatch));
    tx->Commit();
    if (with_object) {
      store->Put(entry.storage_key, arrow::Buffer::FromString("gz"));
    }
    return entry.storage_key;
  }

  bool Indexed(const std::string& key) {
    auto tx    = repo->Begin();
    auto found = repo->GetBatch(*tx, key).has_value();
    tx->Commit();
    return found;
  }

  std::size_t DispatchCount(const std::string& key) {
    auto tx = repo->Begin();
    auto n  = repo->ListDispatches(*tx, key).size();
    tx->Commit();
    return n;
  }
};

RetentionService::Options WeekTtl() {
  RetentionService::Options options;
  options.batch_ttl = std::chrono::hours(24 * 7);
  return options;
}

void TestExpiredBatchesAreRemovedOldestFirst() {
  Fixture    f;
  const auto now    = 100 * kDay;
  const auto old_a  = f.Add("old-a", now - 10 * kDay);
  const auto old_b  = f.Add("old-b", now - 8 * kDay, /*with_object=*/false);
  const auto recent = f.Add("recent", now - 1 * kDay);

  {
    auto tx      = f.repo->Begin();
    auto expired = f.repo->ListBatchesIngestedBefore(*tx, now - 7 * kDay, 0);
    tx->Commit();
    assert(expired.size() == 2);
    assert(expired[0].storage_key == old_a);
    assert(expired[1].storage_key == old_b);
  }

  RetentionService retention(f.repo, f.store, WeekTtl());
  const auto       report = retention.SweepOnce(now);
  assert(report.examined == 2);
  assert(report.objects_removed == 1);
  assert(report.rows_removed == 2);
  assert(report.failed == 0);

  assert(!f.Indexed(old_a) && !f.store->Exists(old_a));
  assert(!f.Indexed(old_b));
  assert(f.DispatchCount(old_a) == 0);
  assert(f.Indexed(recent) && f.store->Exists(recent));
  assert(f.DispatchCount(recent) == 1);

  // nothing left to do
  assert(retention.SweepOnce(now).examined == 0);
}

void TestDryRunRemovesNothing() {
  Fixture    f;
  const auto now = 100 * kDay;
  const auto key = f.Add("old", now - 30 * kDay);

  auto options    = WeekTtl();
  options.dry_run = true;
  RetentionService retention(f.repo, f.store, options);
  const auto       report = retention.SweepOnce(now);
  assert(report.examined == 1);
  assert(report.objects_removed == 0);
  assert(report.rows_removed == 0);
  assert(f.Indexed(key) && f.store->Exists(key));
}

void TestObjectFailureKeepsEntryForRetry() {
  Fixture    f;
  const auto now    = 100 * kDay;
  const auto stuck  = f.Add("stuck", now - 9 * kDay);
  const auto normal = f.Add("normal", now - 8 * kDay);
  f.store->undeletable.insert(stuck);

  RetentionService retention(f.repo, f.store, WeekTtl());
  auto             report = retention.SweepOnce(now);
  assert(report.failed == 1);
  assert(report.rows_removed == 1);
  assert(f.Indexed(stuck));
  assert(!f.Indexed(normal));

  f.store->undeletable.clear();
  report = retention.SweepOnce(now);
  assert(report.rows_removed == 1);
  assert(!f.Indexed(stuck));
}

void TestSweepIsBounded() {
  Fixture    f;
  const auto now = 100 * kDay;
  for (int i = 0; i < 5; ++i) {
    f.Add("b-" + std::to_string(i), now - 10 * kDay + i);
  }

  auto options          = WeekTtl();
  options.max_per_sweep = 2;
  RetentionService retention(f.repo, f.store, options);
  assert(retention.SweepOnce(now).rows_removed == 2);
  assert(retention.SweepOnce(now).rows_removed == 2);
  assert(retention.SweepOnce(now).rows_removed == 1);
}

void TestDeleteMissingBatchIsNotFound() {
  Fixture f;
  auto    tx = f.repo->Begin();
  auto    r  = f.repo->DeleteBatch(*tx, "server-a/boot-1/none.ndjson.gz");
  tx->Rollback();
  assert(!r);
  assert(r.code == vigil::db::ErrorCode::NotFound);
}

void TestOptionsFromConfig() {
  vigil::runtime::config::RetentionConfig config;
  config.set_batch_ttl_seconds(5);
  config.set_sweep_interval_ms(250);
  config.set_dry_run(true);
  auto options = RetentionService::OptionsFromConfig(config);
  assert(options.batch_ttl == 60s);
  assert(options.sweep_interval == 250ms);
  assert(options.dry_run);

  const vigil::runtime::config::RetentionConfig unset;
  assert(RetentionService::OptionsFromConfig(unset).batch_ttl == std::chrono::hours(24 * 7));
}

} // namespace

int main() {
  TestExpiredBatchesAreRemovedOldestFirst();
  TestDryRunRemovesNothing();
  TestObjectFailureKeepsEntryForRetry();
  TestSweepIsBounded();
  TestDeleteMissingBatchIsNotFound();
  TestOptionsFromConfig();
  std::cout << "vigil_retention_service_test: pass\n";
  return 0;
}
