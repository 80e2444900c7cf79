#pragma once

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>

#include "internal/service/ingestion_service.hpp"
#include "vigil/pipeline/v1/ingest_service.grpc.pb.h"

namespace vigil::grpc {

class IngestServer final : public vigil::pipeline::v1::IngestService::Service {
public:
  IngestServer(std::shared_ptr<vigil::service::IngestionService> svc, std::string ingest_token);

  ::grpc::Status Ingest(::grpc::ServerContext* ctx,
                        const vigil::pipeline::v1::IngestRequest* req,
                        vigil::pipeline::v1::IngestResponse* resp) override;

private:
  std::shared_ptr<vigil::service::IngestionService> service_;
  std::string token_;
};

}
