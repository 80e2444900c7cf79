#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace vigil::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
               int max_receive_message_bytes)
    : bind_address_(std::move(bind_address)),
      services_(std::move(services)),
      max_receive_message_bytes_(max_receive_message_bytes) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);
  if (max_receive_message_bytes_ > 0) {
    builder.SetMaxReceiveMessageSize(max_receive_message_bytes_);
  }

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  VIGIL_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                           observability::IntField("port", selected_port_)});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace vigil::runtime
