#include "auth.hpp"

#include "internal/util/errors.hpp"

namespace vigil::grpc {

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return diff == 0;
}

} // namespace

void RequireBearer(const ::grpc::ServerContext* ctx, const std::string& expected, std::string_view surface) {
  if (expected.empty()) {
    return;
  }
  if (!ctx) {
    throw util::Unauthenticated(std::string(surface) + ": missing credentials");
  }

  const auto& metadata = ctx->client_metadata();
  auto        it       = metadata.find("authorization");
  if (it == metadata.end()) {
    throw util::Unauthenticated(std::string(surface) + ": missing authorization header");
  }

  const std::string_view value(it->second.data(), it->second.size());
  if (value.substr(0, kBearerPrefix.size()) != kBearerPrefix ||
      !ConstantTimeEquals(value.substr(kBearerPrefix.size()), expected)) {
    throw util::Unauthenticated(std::string(surface) + ": invalid token");
  }
}

} // namespace vigil::grpc
