#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "internal/capture/bounded_event_queue.hpp"
#include "module_client.hpp"
#include "module_registry.hpp"

namespace vigil::dispatch {

struct DispatchJob {
  std::string                         storage_key;
  vigil::pipeline::v1::AnalyzeRequest request;
};

using LaneCompletion = std::function<void(const ModuleSpec&, const DispatchJob&, const ::grpc::Status&)>;

/*
  One worker thread and one bounded queue per module.

  A slow or hung module only ever fills its own lane; the router sees a
  full lane as a drop and keeps going.
*/
class ModuleLane {
 public:
  ModuleLane(ModuleSpec spec, std::shared_ptr<ModuleClient> client, std::size_t capacity, LaneCompletion on_done);
  ~ModuleLane();

  ModuleLane(const ModuleLane&)            = delete;
  ModuleLane& operator=(const ModuleLane&) = delete;

  void Start();
  // Stops accepting, finishes queued jobs, then joins. A hung call is
  // bounded by the module timeout.
  void Stop();

  bool TrySubmit(DispatchJob job);

  const ModuleSpec& Spec() const {
    return spec_;
  }

  std::size_t Pending() const {
    return queue_.Size();
  }

 private:
  void Run();

  const ModuleSpec                      spec_;
  std::shared_ptr<ModuleClient>         client_;
  capture::BoundedEventQueue<DispatchJob> queue_;
  LaneCompletion                        on_done_;
  std::atomic<bool>                     started_{false};
  std::thread                           thread_;
};

} // namespace vigil::dispatch
