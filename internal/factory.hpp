#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace vesting::core {
class VestingLedger;
}
namespace vesting::token {
class StoreTokenLedger;
}

namespace vesting::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<token::StoreTokenLedger>    tokens;
  std::shared_ptr<core::VestingLedger>        ledger;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root. The only place that knows concrete repository and
  token ledger types. Seeds balances and governance on first start;
  later starts keep what the store holds.
*/
Application Build(const vesting::runtime::config::RuntimeConfig& config);

// Opens the configured backend and creates its schema.
std::shared_ptr<db::Repository> BuildRepository(const vesting::runtime::config::RuntimeConfig& config);

} // namespace vesting::factory
