#include "ingest_server.hpp"
#include "auth.hpp"
#include "grpc_error.hpp"

namespace vigil::grpc {

IngestServer::IngestServer(std::shared_ptr<vigil::service::IngestionService> svc, std::string ingest_token)
    : service_(std::move(svc)), token_(std::move(ingest_token)) {}

::grpc::Status IngestServer::Ingest(::grpc::ServerContext* ctx,
                                    const vigil::pipeline::v1::IngestRequest* req,
                                    vigil::pipeline::v1::IngestResponse* resp) {
  try {
    RequireBearer(ctx, token_, "ingest");
    *resp = service_->Ingest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
