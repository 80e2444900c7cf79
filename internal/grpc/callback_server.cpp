#include "callback_server.hpp"
#include "auth.hpp"
#include "grpc_error.hpp"

namespace vigil::grpc {

namespace {
constexpr std::string_view kSurface = "module callback";
}

CallbackServer::CallbackServer(std::shared_ptr<vigil::service::CallbackService> svc, std::string module_callback_token)
    : service_(std::move(svc)), token_(std::move(module_callback_token)) {}

::grpc::Status CallbackServer::BatchGetPlayerStates(::grpc::ServerContext* ctx,
                                                    const vigil::pipeline::v1::BatchGetPlayerStatesRequest* req,
                                                    vigil::pipeline::v1::BatchGetPlayerStatesResponse* resp) {
  try {
    RequireBearer(ctx, token_, kSurface);
    *resp = service_->BatchGetPlayerStates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CallbackServer::BatchSetPlayerStates(::grpc::ServerContext* ctx,
                                                    const vigil::pipeline::v1::BatchSetPlayerStatesRequest* req,
                                                    vigil::pipeline::v1::BatchSetPlayerStatesResponse* resp) {
  try {
    RequireBearer(ctx, token_, kSurface);
    *resp = service_->BatchSetPlayerStates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CallbackServer::SubmitFindings(::grpc::ServerContext* ctx,
                                              const vigil::pipeline::v1::SubmitFindingsRequest* req,
                                              vigil::pipeline::v1::SubmitFindingsResponse* resp) {
  try {
    RequireBearer(ctx, token_, kSurface);
    *resp = service_->SubmitFindings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
