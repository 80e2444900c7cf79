#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/capture/bounded_event_queue.hpp"
#include "internal/codec/batch_codec.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/batch_index_record.hpp"
#include "internal/model/event_category.hpp"
#include "module_client.hpp"
#include "module_lane.hpp"
#include "module_registry.hpp"

namespace vigil::runtime::config {
class DispatchConfig;
}

namespace vigil::dispatch {

struct IndexedBatch {
  db::model::BatchIndexRecord   entry;
  model::CategoryMask           categories = 0;
  std::shared_ptr<arrow::Buffer> payload;
};

struct DispatcherStats {
  uint64_t routed      = 0;
  uint64_t rejected    = 0;
  uint64_t sent        = 0;
  uint64_t failed      = 0;
  uint64_t skipped     = 0;
  uint64_t dropped     = 0;
};

/*
  Fans indexed batches out to detection modules.

  Ingestion hands batches over through a bounded router queue and never
  waits on a module. The router selects subscribed modules, skips those
  with an open circuit and pushes one job into each module's own lane.
  Modules that ask for a derived view get it built once per batch and
  shared by every module with the same transform. Every decision is
  written to the dispatch history:

    sent     module returned OK
    failed   module returned an error, missed its deadline, or its view
             could not be built
    skipped  circuit open
    dropped  module lane full
*/
class Dispatcher {
 public:
  struct Options {
    std::size_t               router_capacity = 1024;
    std::size_t               lane_capacity   = 64;
    std::chrono::milliseconds default_timeout{5000};
    uint64_t                  max_decoded_bytes = codec::kDefaultMaxDecodedBytes;
  };

  static Options OptionsFromConfig(const vigil::runtime::config::DispatchConfig& config);

  Dispatcher(std::shared_ptr<ModuleRegistry> registry, std::shared_ptr<db::Repository> repository,
             ModuleClientFactory client_factory, Options options);
  ~Dispatcher();

  Dispatcher(const Dispatcher&)            = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  void Start();
  // Drains the router, then stops every lane.
  void Stop();

  // false when the router queue is full or stopped; the batch stays indexed.
  bool Enqueue(IndexedBatch batch);

  // Swaps the module set. Lanes of modules that were removed or changed
  // endpoint or effective timeout are stopped; a batch already routed to
  // one of them is recorded as dropped.
  void ReloadModules(std::vector<ModuleSpec> modules, std::vector<model::ModuleTier> enabled_tiers);

  DispatcherStats Stats() const;

  const std::shared_ptr<ModuleRegistry>& Registry() const {
    return registry_;
  }

 private:
  void        RouterLoop();
  void        Route(const IndexedBatch& batch);
  std::shared_ptr<ModuleLane> LaneFor(const ModuleSpec& spec);
  std::chrono::milliseconds   EffectiveTimeout(const ModuleSpec& spec) const;
  void        OnLaneDone(const ModuleSpec& spec, const DispatchJob& job, const ::grpc::Status& status);
  void        RecordDispatch(const std::string& storage_key, const std::string& module, db::model::DispatchStatus status,
                             const std::string& error);

  std::shared_ptr<ModuleRegistry>          registry_;
  std::shared_ptr<db::Repository>          repo_;
  ModuleClientFactory                      client_factory_;
  const Options                            options_;
  capture::BoundedEventQueue<IndexedBatch> router_queue_;

  std::mutex                                         lanes_mutex_;
  std::map<std::string, std::shared_ptr<ModuleLane>> lanes_;

  std::atomic<bool>     started_{false};
  std::thread           router_;
  std::atomic<uint64_t> routed_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> skipped_{0};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace vigil::dispatch
