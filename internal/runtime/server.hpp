#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace vigil::runtime {

class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
         int max_receive_message_bytes = 0);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the configured one when it was 0.
  int SelectedPort() const { return selected_port_; }

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  int max_receive_message_bytes_;
  int selected_port_ = 0;
  std::unique_ptr<::grpc::Server> grpc_server_;
};

} // namespace vigil::runtime
