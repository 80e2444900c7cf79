#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using vigil::db::ErrorCode;
using vigil::db::Repository;
using vigil::db::memory::MemoryRepository;
using vigil::db::model::BatchIndexRecord;
using vigil::db::model::BatchStatus;
using vigil::db::model::DispatchRecord;
using vigil::db::model::DispatchStatus;
using vigil::db::model::FindingRecord;
using vigil::db::model::PlayerStateRecord;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

BatchIndexRecord MakeBatch(const std::string& source, const std::string& batch_id, int64_t ingested_at_ms) {
  BatchIndexRecord r;
  r.batch_id       = batch_id;
  r.source_id      = source;
  r.session_id     = "session-1";
  r.storage_key    = source + "/session-1/" + batch_id + ".ndjson.gz";
  r.created_at_ms  = ingested_at_ms - 100;
  r.ingested_at_ms = ingested_at_ms;
  r.record_count   = 42;
  r.payload_bytes  = 1024;
  return r;
}

FindingRecord MakeFinding(const std::string& module, const std::string& entity, int64_t ts) {
  FindingRecord f;
  f.module         = module;
  f.entity_id      = entity;
  f.check          = "reach";
  f.severity       = vigil::pipeline::v1::SEVERITY_HIGH;
  f.confidence     = 0.75;
  f.evidence       = R"({"distance":4.2})";
  f.timestamp_ms   = ts;
  f.source_id      = "server-a";
  f.title          = "Reach";
  f.received_at_ms = ts + 5;
  return f;
}

void VerifyBatchIndex(Repository& repo, const std::string& source) {
  const auto first  = MakeBatch(source, "b-1", 1000);
  const auto second = MakeBatch(source, "b-2", 2000);

  {
    auto tx = repo.Begin();
    assert(repo.InsertBatch(*tx, first));
    assert(repo.InsertBatch(*tx, second));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertBatch(*tx, first);
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx  = repo.Begin();
    auto got = repo.GetBatch(*tx, first.storage_key);
    assert(got.has_value());
    assert(got->batch_id == "b-1");
    assert(got->record_count == 42);
    assert(got->status == BatchStatus::kIndexed);

    assert(!repo.GetBatch(*tx, source + "/missing").has_value());

    auto listed = repo.ListBatches(*tx, source, 10);
    assert(listed.size() == 2);
    assert(listed[0].batch_id == "b-2");
    assert(listed[1].batch_id == "b-1");

    auto limited = repo.ListBatches(*tx, source, 1);
    assert(limited.size() == 1);
    assert(limited[0].batch_id == "b-2");
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.UpdateBatchStatus(*tx, first.storage_key, BatchStatus::kDispatched, 3));
    auto missing = repo.UpdateBatchStatus(*tx, source + "/nope", BatchStatus::kDispatched, 1);
    assert(missing.code == ErrorCode::NotFound);
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto got = repo.GetBatch(*tx, first.storage_key);
    assert(got->status == BatchStatus::kDispatched);
    assert(got->dispatched_modules == 3);
    tx->Commit();
  }
}

void VerifyRetentionQueries(Repository& repo, const std::string& source) {
  const auto expired = MakeBatch(source, "old", 500);
  const auto kept    = MakeBatch(source, "new", 1500);
  {
    auto tx = repo.Begin();
    assert(repo.InsertBatch(*tx, kept));
    assert(repo.InsertBatch(*tx, expired));
    assert(repo.InsertDispatch(*tx, DispatchRecord{expired.storage_key, "aim", DispatchStatus::kSent, "", 600}));
    tx->Commit();
  }

  {
    // other sources may share the database; only look at ours
    auto tx = repo.Begin();
    std::vector<std::string> keys;
    for (const auto& r : repo.ListBatchesIngestedBefore(*tx, 1000, 0)) {
      if (r.source_id == source) keys.push_back(r.storage_key);
    }
    tx->Commit();
    assert(keys.size() == 1);
    assert(keys[0] == expired.storage_key);
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteBatch(*tx, expired.storage_key));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.GetBatch(*tx, expired.storage_key).has_value());
  assert(repo.ListDispatches(*tx, expired.storage_key).empty());
  assert(repo.GetBatch(*tx, kept.storage_key).has_value());
  auto again = repo.DeleteBatch(*tx, expired.storage_key);
  assert(again.code == ErrorCode::NotFound);
  tx->Rollback();
}

void VerifyDispatchHistory(Repository& repo, const std::string& key) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertDispatch(*tx, DispatchRecord{key, "aim", DispatchStatus::kSent, "", 10}));
    assert(repo.InsertDispatch(*tx, DispatchRecord{key, "reach", DispatchStatus::kFailed, "deadline exceeded", 11}));
    assert(repo.InsertDispatch(*tx, DispatchRecord{key + "-other", "aim", DispatchStatus::kSkipped, "circuit open", 12}));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto rows = repo.ListDispatches(*tx, key);
  tx->Commit();
  assert(rows.size() == 2);
  assert(rows[0].module == "aim");
  assert(rows[0].status == DispatchStatus::kSent);
  assert(rows[1].module == "reach");
  assert(rows[1].status == DispatchStatus::kFailed);
  assert(rows[1].error == "deadline exceeded");
}

void VerifyPlayerState(Repository& repo, const std::string& entity) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertPlayerState(*tx, PlayerStateRecord{"server-a", entity, "vl", vigil::model::ValueKind::kNumber, "3", 100}));
    assert(repo.UpsertPlayerState(*tx, PlayerStateRecord{"server-a", entity, "tag", vigil::model::ValueKind::kString, "x", 100}));
    assert(repo.UpsertPlayerState(*tx, PlayerStateRecord{"server-b", entity, "vl", vigil::model::ValueKind::kNumber, "9", 100}));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.UpsertPlayerState(*tx, PlayerStateRecord{"server-a", entity, "vl", vigil::model::ValueKind::kNumber, "4", 200}));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto rows = repo.GetPlayerStates(*tx, "server-a", entity, {"vl", "tag", "absent"});
  tx->Commit();

  assert(rows.size() == 2);
  for (const auto& row : rows) {
    if (row.key == "vl") {
      assert(row.value == "4");
      assert(row.kind == vigil::model::ValueKind::kNumber);
      assert(row.updated_at_ms == 200);
    } else {
      assert(row.key == "tag");
      assert(row.kind == vigil::model::ValueKind::kString);
      assert(row.value == "x");
    }
  }
}

void VerifyFindings(Repository& repo, const std::string& entity) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertFinding(*tx, MakeFinding("reach", entity, 1000)));
    assert(repo.InsertFinding(*tx, MakeFinding("reach", entity, 2000)));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertFinding(*tx, MakeFinding("reach", entity, 1000));
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx   = repo.Begin();
  auto rows = repo.ListFindings(*tx, entity, 10);
  tx->Commit();
  assert(rows.size() == 2);
  assert(rows[0].timestamp_ms == 2000);
  assert(rows[1].timestamp_ms == 1000);
  assert(rows[0].severity == vigil::pipeline::v1::SEVERITY_HIGH);
  assert(rows[0].confidence == 0.75);
  assert(rows[0].title == "Reach");
}

void VerifyRollbackBehavior(Repository& repo, const std::string& source) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBatch(*tx, MakeBatch(source, "rolled-back", 5000)));
    tx->Rollback();
  }

  {
    // destructor without commit rolls back too
    auto tx = repo.Begin();
    assert(repo.InsertBatch(*tx, MakeBatch(source, "abandoned", 6000)));
  }

  auto tx = repo.Begin();
  assert(repo.ListBatches(*tx, source, 10).empty());
  tx->Commit();
}

void VerifyConcurrentInsert(Repository& repo, const std::string& source, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  const auto batch = MakeBatch(source, "raced", 7000);
  auto       tx1   = repo.Begin();
  auto       tx2   = repo.Begin();

  assert(repo.InsertBatch(*tx1, batch));
  assert(repo.InsertBatch(*tx2, batch));

  tx1->Commit();

  bool threw = false;
  try {
    tx2->Commit();
  } catch (const vigil::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  auto verify = repo.Begin();
  assert(repo.ListBatches(*verify, source, 10).size() == 1);
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& source) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertBatch(*tx, MakeBatch(source, "durable", 9000)));
    assert(repo->InsertFinding(*tx, MakeFinding("durable", source + "-entity", 9000)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetBatch(*tx, MakeBatch(source, "durable", 9000).storage_key).has_value());
  assert(repo->ListFindings(*tx, source + "-entity", 10).size() == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if VIGIL_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("vigil_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    vigil::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return vigil::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      // one connection, one transaction at a time
      .supports_parallel_transactions = false,
  };
}
#endif

#if VIGIL_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("VIGIL_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("VIGIL_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    vigil::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    return vigil::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      // a unique violation aborts the second transaction before commit
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto run = backend.name + "-" + std::to_string(NowMs());
  {
    auto repo = backend.make_repository();

    VerifyBatchIndex(*repo, run + "-index");
    VerifyRetentionQueries(*repo, run + "-retention");
    VerifyDispatchHistory(*repo, run + "-dispatch-key");
    VerifyPlayerState(*repo, run + "-entity");
    VerifyFindings(*repo, run + "-finding-entity");
    VerifyRollbackBehavior(*repo, run + "-rollback");
    VerifyConcurrentInsert(*repo, run + "-race", backend.supports_parallel_transactions);
  }

  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if VIGIL_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if VIGIL_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "vigil_integration_repository_parity: pass\n";
  return 0;
}
