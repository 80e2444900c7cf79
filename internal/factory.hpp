#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/module_client.hpp"
#include "internal/findings/findings_forwarder.hpp"

namespace vigil::dispatch { class Dispatcher; }
namespace vigil::findings { class FindingsForwarder; }
namespace vigil::service {
class IngestionService;
class CallbackService;
class RetentionService;
}

namespace vigil::factory {

/*
  Application

  Owns all long-lived objects of the backend process.
  grpc_services are handed to runtime::Server; the rest lives until
  Shutdown().
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<dispatch::Dispatcher> dispatcher;
  std::shared_ptr<service::IngestionService> ingestion;
  std::shared_ptr<service::CallbackService> callbacks;
  std::shared_ptr<findings::FindingsForwarder> forwarder;
  // null when retention is disabled
  std::shared_ptr<service::RetentionService> retention;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Applies the modules and dispatch tiers of a freshly loaded config.
  // Throws util::InvalidArgument and leaves the running set untouched when
  // the module list is invalid. Other sections need a restart.
  void ReloadModules(const vigil::runtime::config::RuntimeConfig& config);

  // Stops retention, drains the dispatcher with a bounded wait, then
  // delivers queued finding notifications.
  void Shutdown();
};

uint64_t MaxPayloadBytes(const vigil::runtime::config::RuntimeConfig& config);

// ingest.max_decoded_bytes, or 8x the payload limit when unset.
uint64_t MaxDecodedBytes(const vigil::runtime::config::RuntimeConfig& config);

// server.max_receive_message_bytes, or the payload limit plus 1 MiB of
// headroom for the rest of the request when unset.
int MaxReceiveMessageBytes(const vigil::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const vigil::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root of the backend. It is the only place that knows
  concrete DB, storage and module client types. client_factory defaults
  to gRPC clients authenticated with auth.module_token, notifier_factory
  to gRPC clients for each findings subscriber.
*/
Application Build(const vigil::runtime::config::RuntimeConfig& config,
                  dispatch::ModuleClientFactory client_factory = {},
                  findings::NotifierFactory notifier_factory = {});

} // namespace vigil::factory
