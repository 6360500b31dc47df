#pragma once

#include <grpcpp/grpcpp.h>

#include <string>

namespace vesting::grpc {

inline constexpr const char* kCallerMetadataKey = "x-vesting-caller";

// Caller identity from request metadata; empty when absent.
std::string CallerFrom(const ::grpc::ServerContext* context);

} // namespace vesting::grpc
