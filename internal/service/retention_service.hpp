#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace vigil::db { class Repository; }
namespace vigil::storage { class BatchStore; }
namespace vigil::runtime::config { class RetentionConfig; }

namespace vigil::service {

struct RetentionReport {
  uint64_t examined        = 0;
  uint64_t objects_removed = 0;
  uint64_t rows_removed    = 0;
  uint64_t failed          = 0;
};

/*
  Expires stored batches older than the TTL.

  For each expired index entry the stored object goes first, then the
  entry and its dispatch history. A batch whose object could not be
  removed keeps its entry and is retried on the next sweep. Findings and
  player state are never touched.

  Once an entry is gone the agent's idempotency guard no longer covers
  that batch id; a replay older than the TTL is ingested again.
*/
class RetentionService {
 public:
  struct Options {
    std::chrono::seconds      batch_ttl{7 * 24 * 3600};
    std::chrono::milliseconds sweep_interval{60000};
    uint64_t                  max_per_sweep = 500;
    bool                      dry_run       = false;
  };

  // TTLs below one minute are raised to one minute.
  static Options OptionsFromConfig(const vigil::runtime::config::RetentionConfig& config);

  RetentionService(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::BatchStore> batch_store,
                   Options options);
  ~RetentionService();

  RetentionService(const RetentionService&)            = delete;
  RetentionService& operator=(const RetentionService&) = delete;

  RetentionReport SweepOnce(int64_t now_ms);

  void Start();
  void Stop();

 private:
  void Run();
  bool RemoveOne(const std::string& storage_key, RetentionReport& report);

  std::shared_ptr<db::Repository>      repo_;
  std::shared_ptr<storage::BatchStore> store_;
  const Options                        options_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::atomic<bool>       running_{false};
};

} // namespace vigil::service
