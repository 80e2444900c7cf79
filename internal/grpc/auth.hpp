#pragma once

#include <grpcpp/server_context.h>

#include <string>
#include <string_view>

namespace vigil::grpc {

/*
  Bearer token check on "authorization" metadata.

  An empty expected token disables the check for that surface.
  Throws util::Unauthenticated on a missing or wrong token.
*/
void RequireBearer(const ::grpc::ServerContext* ctx, const std::string& expected, std::string_view surface);

} // namespace vigil::grpc
