#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace vesting::grpc {

/*
  Converts ledger exceptions into gRPC status codes.

  The status message is the exception text, which starts with the
  error name ("NothingToClaim: ...").
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace vesting::grpc
