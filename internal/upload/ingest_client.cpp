#include "ingest_client.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

namespace vigil::upload {

std::string_view ToString(UploadResult result) {
  switch (result) {
    case UploadResult::kAccepted:
      return "accepted";
    case UploadResult::kTransient:
      return "transient";
    case UploadResult::kPermanent:
      return "permanent";
  }
  return "unknown";
}

UploadResult ClassifyStatus(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::OK:
      return UploadResult::kAccepted;

    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::OUT_OF_RANGE:
    case ::grpc::StatusCode::DATA_LOSS:
    case ::grpc::StatusCode::UNIMPLEMENTED:
    case ::grpc::StatusCode::ALREADY_EXISTS:
    case ::grpc::StatusCode::NOT_FOUND:
      return UploadResult::kPermanent;

    // UNAVAILABLE, DEADLINE_EXCEEDED, RESOURCE_EXHAUSTED, ABORTED, INTERNAL,
    // UNKNOWN, CANCELLED, UNAUTHENTICATED, PERMISSION_DENIED, FAILED_PRECONDITION
    default:
      return UploadResult::kTransient;
  }
}

GrpcIngestClient::GrpcIngestClient(std::shared_ptr<::grpc::Channel> channel, std::string token)
    : stub_(vigil::pipeline::v1::IngestService::NewStub(std::move(channel))), token_(std::move(token)) {
}

std::shared_ptr<GrpcIngestClient> GrpcIngestClient::FromConfig(const vigil::runtime::config::UploadConfig& config) {
  const auto endpoint = config.endpoint().empty() ? std::string("localhost:50051") : config.endpoint();
  return std::make_shared<GrpcIngestClient>(::grpc::CreateChannel(endpoint, ::grpc::InsecureChannelCredentials()), config.token());
}

UploadOutcome GrpcIngestClient::Upload(const std::string& batch_id, const std::shared_ptr<arrow::Buffer>& payload,
                                       std::chrono::milliseconds timeout) {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
  if (!token_.empty()) {
    ctx.AddMetadata("authorization", "Bearer " + token_);
  }

  vigil::pipeline::v1::IngestRequest req;
  req.set_batch_id(batch_id);
  req.set_payload(payload->data(), static_cast<size_t>(payload->size()));

  vigil::pipeline::v1::IngestResponse resp;
  const auto                          status = stub_->Ingest(&ctx, req, &resp);

  UploadOutcome outcome;
  outcome.result = ClassifyStatus(status.error_code());
  if (!status.ok()) {
    outcome.message = status.error_message();
    return outcome;
  }
  outcome.storage_key = resp.storage_key();
  outcome.duplicate   = resp.duplicate();
  return outcome;
}

} // namespace vigil::upload
