#pragma once

#include <arrow/buffer.h>
#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "vigil/pipeline/v1/ingest_service.grpc.pb.h"

namespace vigil::upload {

enum class UploadResult {
  kAccepted,
  // keep the file and retry on a later pass
  kTransient,
  // the backend will never accept this file
  kPermanent,
};

std::string_view ToString(UploadResult result);

struct UploadOutcome {
  UploadResult result = UploadResult::kTransient;
  std::string  message;
  std::string  storage_key;
  bool         duplicate = false;
};

/*
  Transport seam for BatchUploader.
*/
class IngestClient {
 public:
  virtual ~IngestClient() = default;

  virtual UploadOutcome Upload(const std::string& batch_id, const std::shared_ptr<arrow::Buffer>& payload,
                               std::chrono::milliseconds timeout) = 0;
};

UploadResult ClassifyStatus(::grpc::StatusCode code);

/*
  IngestService.Ingest over gRPC with a per-call deadline and the bearer
  token in "authorization" metadata.
*/
class GrpcIngestClient final : public IngestClient {
 public:
  GrpcIngestClient(std::shared_ptr<::grpc::Channel> channel, std::string token);

  static std::shared_ptr<GrpcIngestClient> FromConfig(const vigil::runtime::config::UploadConfig& config);

  UploadOutcome Upload(const std::string& batch_id, const std::shared_ptr<arrow::Buffer>& payload,
                       std::chrono::milliseconds timeout) override;

 private:
  std::unique_ptr<vigil::pipeline::v1::IngestService::Stub> stub_;
  std::string                                               token_;
};

} // namespace vigil::upload
