#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/codec/batch_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/findings/findings_sink.hpp"
#include "internal/grpc/auth.hpp"
#include "internal/grpc/callback_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/service/service_context.hpp"
#include "internal/state/player_state_store.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/time.hpp"

namespace {

vigil::service::ServiceContext BuildServiceContext() {
  vigil::service::ServiceContext ctx;
  auto                           repository = std::make_shared<vigil::db::memory::MemoryRepository>();
  ctx.repository                            = repository;

  vigil::runtime::config::ObjectStoreConfig store;
  store.set_root_uri((std::filesystem::temp_directory_path() /
                      ("vigil_grpc_status_" + std::to_string(vigil::util::NowUnixMillis())))
                         .string());
  ctx.batch_store  = vigil::storage::StorageFactory::Build(store);
  ctx.player_state = std::make_shared<vigil::state::PlayerStateStore>(repository);
  ctx.findings     = std::make_shared<vigil::findings::FindingsSink>(repository);
  return ctx;
}

std::string ValidPayload() {
  vigil::model::PacketBatch batch;
  batch.source_id  = "server-a";
  batch.session_id = "boot-1";
  vigil::model::PacketRecord r;
  r.timestamp_ms = 1;
  r.event_type   = "PLAYER_POSITION";
  r.entity_id    = "u-1";
  batch.records.push_back(r);
  return vigil::codec::EncodeBatch(batch)->ToString();
}

void TestExceptionMapping() {
  using vigil::grpc::ToStatus;
  assert(ToStatus(vigil::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(vigil::util::Unauthenticated("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(vigil::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(vigil::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(vigil::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(vigil::util::Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(vigil::util::ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(vigil::util::InvalidArgument("bad key")).error_message() == "bad key");
}

void TestIngestWithoutTokenIsUnauthenticated() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<vigil::service::IngestionService>(ctx);
  vigil::grpc::IngestServer server(service, "agent-secret");

  vigil::pipeline::v1::IngestRequest req;
  req.set_batch_id("batch-1");
  req.set_payload(ValidPayload());
  vigil::pipeline::v1::IngestResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.Ingest(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  // nothing was indexed
  assert(service->ListBatches("", 10).empty());
}

void TestMalformedPayloadReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  vigil::grpc::IngestServer server(std::make_shared<vigil::service::IngestionService>(ctx), "");

  vigil::pipeline::v1::IngestRequest req;
  req.set_batch_id("batch-1");
  req.set_payload("not a gzip stream");
  vigil::pipeline::v1::IngestResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  assert(server.Ingest(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_payload(ValidPayload());
  const auto ok = server.Ingest(&grpc_ctx, &req, &resp);
  assert(ok.ok());
  assert(resp.storage_key() == "server-a/boot-1/batch-1.ndjson.gz");
}

void TestCallbackValidationMapsToInvalidArgument() {
  auto ctx = BuildServiceContext();
  vigil::grpc::CallbackServer server(std::make_shared<vigil::service::CallbackService>(ctx), "");
  ::grpc::ServerContext       grpc_ctx;

  vigil::pipeline::v1::BatchGetPlayerStatesRequest get;
  get.add_keys("vl");
  vigil::pipeline::v1::BatchGetPlayerStatesResponse get_resp;
  assert(server.BatchGetPlayerStates(&grpc_ctx, &get, &get_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  vigil::pipeline::v1::SubmitFindingsRequest submit;
  auto*                                      finding = submit.add_findings();
  finding->set_module("reach");
  finding->set_entity_id("u-1");
  finding->set_check("distance");
  finding->set_confidence(0.5);
  finding->set_timestamp_ms(10);
  vigil::pipeline::v1::SubmitFindingsResponse submit_resp;
  // severity left unspecified
  assert(server.SubmitFindings(&grpc_ctx, &submit, &submit_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  finding->set_severity(vigil::pipeline::v1::SEVERITY_LOW);
  assert(server.SubmitFindings(&grpc_ctx, &submit, &submit_resp).ok());
  assert(submit_resp.accepted() == 1);
}

void TestCallbackRequiresModuleToken() {
  auto ctx = BuildServiceContext();
  vigil::grpc::CallbackServer server(std::make_shared<vigil::service::CallbackService>(ctx), "module-secret");
  ::grpc::ServerContext       grpc_ctx;

  vigil::pipeline::v1::BatchSetPlayerStatesRequest set;
  set.set_entity_id("u-1");
  (*set.mutable_values())["vl"].set_number_value(1);
  vigil::pipeline::v1::BatchSetPlayerStatesResponse set_resp;
  assert(server.BatchSetPlayerStates(&grpc_ctx, &set, &set_resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  bool threw = false;
  try {
    vigil::grpc::RequireBearer(nullptr, "module-secret", "module callback");
  } catch (const vigil::util::Unauthenticated&) {
    threw = true;
  }
  assert(threw);
  vigil::grpc::RequireBearer(nullptr, "", "module callback");
}

} // namespace

int main() {
  TestExceptionMapping();
  TestIngestWithoutTokenIsUnauthenticated();
  TestMalformedPayloadReturnsInvalidArgument();
  TestCallbackValidationMapsToInvalidArgument();
  TestCallbackRequiresModuleToken();

  std::cout << "vigil_grpc_status_test: pass\n";
  return 0;
}
