#include "caller_identity.hpp"

namespace vesting::grpc {

std::string CallerFrom(const ::grpc::ServerContext* context) {
  if (!context) {
    return {};
  }
  const auto& metadata = context->client_metadata();
  const auto  it       = metadata.find(kCallerMetadataKey);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

} // namespace vesting::grpc
