#include "factory.hpp"

#include <stdexcept>
#include <string>
#include <map>

#include "internal/core/vesting_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/events/logging_event_sink.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/vesting_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/vesting_service.hpp"
#include "internal/token/store_token_ledger.hpp"
#include "internal/util/time.hpp"
#if VESTING_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if VESTING_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace vesting::factory {

namespace {

#if VESTING_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const char* sql : db::sql::SQLITE_SCHEMA_DDL) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if VESTING_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const char* sql : db::sql::POSTGRES_SCHEMA_DDL) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

std::shared_ptr<token::StoreTokenLedger> BuildTokenLedger(const vesting::runtime::config::TokenLedgerConfig& config,
                                                          std::shared_ptr<db::Repository>                    repository) {
  const std::string custody = config.custody_account().empty() ? std::string("vesting-custody") : config.custody_account();

  std::map<model::Address, model::Amount> balances;
  for (const auto& [account, amount] : config.initial_balances()) {
    if (account == custody) {
      throw std::runtime_error("token_ledger.initial_balances must not fund the custody account");
    }
    balances.emplace(account, amount);
  }

  auto tokens = std::make_shared<token::StoreTokenLedger>(std::move(repository), custody);
  if (tokens->Seed(balances)) {
    VESTING_LOG_INFO("token balances seeded", {observability::UintField("accounts", balances.size())});
  } else if (!balances.empty()) {
    VESTING_LOG_INFO("token balances already recorded; ignoring token_ledger.initial_balances");
  }
  return tokens;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const vesting::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if VESTING_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if VESTING_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const vesting::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.tokens     = BuildTokenLedger(config.token_ledger(), app.repository);

  auto events = std::make_shared<events::LoggingEventSink>();
  auto clock  = std::make_shared<util::SystemClock>();

  core::LedgerLimits limits;
  limits.max_schedules_per_beneficiary = config.limits().max_schedules_per_beneficiary();
  limits.max_batch_size                = config.limits().max_batch_size();

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.ledger = std::make_shared<core::VestingLedger>(app.repository, app.tokens, events, clock, limits);
  app.ledger->Bootstrap(config.governance().administrator(), config.governance().recovery_account());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.ledger = app.ledger;

  auto vesting_service = std::make_shared<service::VestingService>(ctx);
  auto admin_service   = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::VestingServer>(vesting_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  VESTING_LOG_INFO("ledger ready", {observability::StringField("custody_account", app.tokens->CustodyAccount()),
                                    observability::UintField("custody_balance", app.tokens->CustodyBalance())});
  return app;
}

} // namespace vesting::factory
