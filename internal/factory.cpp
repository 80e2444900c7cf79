#include "factory.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/dispatch/module_registry.hpp"
#include "internal/findings/findings_forwarder.hpp"
#include "internal/findings/findings_sink.hpp"
#include "internal/grpc/callback_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/callback_service.hpp"
#include "internal/service/ingestion_service.hpp"
#include "internal/service/retention_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/state/player_state_store.hpp"
#include "internal/storage/storage_factory.hpp"
#if VIGIL_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if VIGIL_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace vigil::factory {

using namespace vigil;
using vigil::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const vigil::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if VIGIL_DB_SQLITE
    const auto path = database.sqlite().path().empty() ? std::string("vigil.db") : database.sqlite().path();
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
    sqlite_db->ApplySchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if VIGIL_DB_POSTGRES
    const auto& pg = database.postgres();
    auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(),
                                                       pg.max_connections() > 0 ? pg.max_connections() : 16);
    pool->ApplySchema();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

namespace {

constexpr uint64_t kDefaultMaxPayloadBytes = 16ULL * 1024 * 1024;
constexpr uint64_t kReceiveHeadroomBytes   = 1024 * 1024;
constexpr std::size_t kDefaultForwarderQueue = 256;

} // namespace

uint64_t MaxPayloadBytes(const vigil::runtime::config::RuntimeConfig& config) {
  return config.ingest().max_payload_bytes() > 0 ? config.ingest().max_payload_bytes() : kDefaultMaxPayloadBytes;
}

uint64_t MaxDecodedBytes(const vigil::runtime::config::RuntimeConfig& config) {
  return config.ingest().max_decoded_bytes() > 0 ? config.ingest().max_decoded_bytes() : 8 * MaxPayloadBytes(config);
}

int MaxReceiveMessageBytes(const vigil::runtime::config::RuntimeConfig& config) {
  if (config.server().max_receive_message_bytes() > 0) {
    return static_cast<int>(std::min<uint64_t>(config.server().max_receive_message_bytes(),
                                               std::numeric_limits<int>::max()));
  }
  return static_cast<int>(
      std::min<uint64_t>(MaxPayloadBytes(config) + kReceiveHeadroomBytes, std::numeric_limits<int>::max()));
}

void Application::ReloadModules(const vigil::runtime::config::RuntimeConfig& config) {
  if (!dispatcher) {
    return;
  }
  auto modules = dispatch::SpecsFromConfig(config);
  const auto count = modules.size();
  dispatcher->ReloadModules(std::move(modules), dispatch::EnabledTiersFromConfig(config));
  VIGIL_LOG_INFO("detection modules reloaded", {observability::IntField("modules", static_cast<int64_t>(count))});
}

void Application::Shutdown() {
  if (retention) {
    retention->Stop();
  }
  if (dispatcher) {
    dispatcher->Stop();
  }
  if (forwarder) {
    forwarder->Stop();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const vigil::runtime::config::RuntimeConfig& config, dispatch::ModuleClientFactory client_factory,
                  findings::NotifierFactory notifier_factory) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto batch_store = storage::StorageFactory::Build(config.object_store());
  auto repository  = BuildRepository(config);

  // ------------------------------------------------------------------
  // Dispatch
  // ------------------------------------------------------------------
  if (!client_factory) {
    client_factory = dispatch::GrpcModuleClientFactory(config.auth().module_token());
  }
  if (!notifier_factory) {
    notifier_factory = findings::GrpcNotifierFactory();
  }
  auto registry = std::make_shared<dispatch::ModuleRegistry>(dispatch::SpecsFromConfig(config),
                                                             dispatch::HealthPolicyFromConfig(config),
                                                             dispatch::EnabledTiersFromConfig(config));
  auto dispatch_options              = dispatch::Dispatcher::OptionsFromConfig(config.dispatch());
  dispatch_options.max_decoded_bytes = MaxDecodedBytes(config);
  auto dispatcher = std::make_shared<dispatch::Dispatcher>(registry, repository, std::move(client_factory),
                                                           dispatch_options);
  dispatcher->Start();

  for (const auto& module : registry->Modules()) {
    VIGIL_LOG_INFO("detection module registered", {StringField("module", module.name), StringField("endpoint", module.endpoint),
                                                   StringField("tier", model::ToString(module.tier)),
                                                   StringField("transform", codec::ToString(module.transform)),
                                                   observability::BoolField("enabled", module.enabled)});
  }

  // ------------------------------------------------------------------
  // Findings fan-out
  // ------------------------------------------------------------------
  findings::FindingsForwarder::Options forwarder_options;
  forwarder_options.queue_capacity =
      config.findings().queue_capacity() > 0 ? config.findings().queue_capacity() : kDefaultForwarderQueue;
  auto forwarder = std::make_shared<findings::FindingsForwarder>(findings::SubscribersFromConfig(config.findings()),
                                                                 std::move(notifier_factory), forwarder_options);
  forwarder->Start();
  for (const auto& s : config.findings().subscribers()) {
    VIGIL_LOG_INFO("findings subscriber registered",
                   {StringField("subscriber", s.name()), StringField("endpoint", s.endpoint())});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository   = repository;
  ctx.batch_store  = batch_store;
  ctx.dispatcher   = dispatcher;
  ctx.player_state = std::make_shared<state::PlayerStateStore>(repository, config.state().max_keys_per_request());
  ctx.findings     = std::make_shared<findings::FindingsSink>(repository, forwarder);
  ctx.max_payload_bytes = MaxPayloadBytes(config);
  ctx.max_decoded_bytes = MaxDecodedBytes(config);

  auto ingestion = std::make_shared<service::IngestionService>(ctx);
  auto callbacks = std::make_shared<service::CallbackService>(ctx);

  if (config.auth().ingest_token().empty()) {
    VIGIL_LOG_WARN("ingest_token is empty; ingestion accepts unauthenticated agents");
  }
  if (config.auth().module_callback_token().empty()) {
    VIGIL_LOG_WARN("module_callback_token is empty; callbacks accept unauthenticated modules");
  }

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(ingestion, config.auth().ingest_token()));
  app.grpc_services.push_back(std::make_unique<grpc::CallbackServer>(callbacks, config.auth().module_callback_token()));

  // ------------------------------------------------------------------
  // Retention
  // ------------------------------------------------------------------
  if (config.retention().enabled()) {
    auto options = service::RetentionService::OptionsFromConfig(config.retention());
    app.retention = std::make_shared<service::RetentionService>(repository, batch_store, options);
    app.retention->Start();
    VIGIL_LOG_INFO("batch retention enabled", {observability::IntField("batch_ttl_seconds", options.batch_ttl.count()),
                                               observability::BoolField("dry_run", options.dry_run)});
  }

  app.repository = repository;
  app.dispatcher = dispatcher;
  app.ingestion  = ingestion;
  app.callbacks  = callbacks;
  app.forwarder  = forwarder;

  return app;
}

} // namespace vigil::factory
