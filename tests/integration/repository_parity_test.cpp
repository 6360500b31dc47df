#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/vesting_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/governance_record.hpp"
#include "internal/db/model/schedule_record.hpp"
#include "internal/events/logging_event_sink.hpp"
#include "internal/factory.hpp"
#include "internal/token/store_token_ledger.hpp"
#include "internal/util/time.hpp"

namespace {

using vesting::db::ErrorCode;
using vesting::db::Repository;
using vesting::db::memory::MemoryRepository;
using vesting::db::model::GovernanceRecord;
using vesting::db::model::ScheduleRecord;
using vesting::token::StoreTokenLedger;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

ScheduleRecord MakeRecord(const std::string& beneficiary, uint64_t total, uint64_t cliff, uint64_t ramp_end) {
  ScheduleRecord record;
  record.beneficiary              = beneficiary;
  record.schedule.total_amount    = total;
  record.schedule.upfront_amount  = total / 10;
  record.schedule.claimable_cache = total / 10;
  record.schedule.cliff_time      = cliff;
  record.schedule.ramp_start      = cliff;
  record.schedule.ramp_end        = ramp_end;
  return record;
}

void VerifyAppendListUpdate(Repository& repo, const std::string& beneficiary) {
  auto tx = repo.Begin();

  auto first  = MakeRecord(beneficiary, 1000, 100, 1100);
  auto second = MakeRecord(beneficiary, 300, 10, 20);
  assert(repo.AppendSchedule(*tx, first));
  assert(repo.AppendSchedule(*tx, second));
  assert(first.schedule_index == 0);
  assert(second.schedule_index == 1);

  auto listed = repo.ListSchedules(*tx, beneficiary);
  assert(listed.size() == 2);
  assert(listed[0].schedule_index == 0);
  assert(listed[0].schedule.total_amount == 1000);
  assert(listed[0].schedule.upfront_amount == 100);
  assert(listed[0].schedule.ramp_start == 100);
  assert(listed[1].schedule.ramp_end == 20);

  listed[0].schedule.claimed_amount  = 550;
  listed[0].schedule.claimable_cache = 0;
  assert(repo.UpdateSchedule(*tx, listed[0]));

  auto missing           = listed[1];
  missing.schedule_index = 99;
  const auto update      = repo.UpdateSchedule(*tx, missing);
  assert(!update);
  assert(update.code == ErrorCode::NotFound);

  tx->Commit();

  auto verify_tx = repo.Begin();
  auto reread    = repo.ListSchedules(*verify_tx, beneficiary);
  assert(reread.size() == 2);
  assert(reread[0].schedule.claimed_amount == 550);
  assert(reread[0].schedule.claimable_cache == 0);
  assert(reread[1].schedule.claimed_amount == 0);

  const auto holders = repo.ListBeneficiaries(*verify_tx);
  assert(std::find(holders.begin(), holders.end(), beneficiary) != holders.end());
  assert(std::is_sorted(holders.begin(), holders.end()));
  verify_tx->Commit();
}

void VerifyFullWidthValues(Repository& repo, const std::string& beneficiary) {
  const auto max = std::numeric_limits<uint64_t>::max();

  auto tx     = repo.Begin();
  auto record = MakeRecord(beneficiary, max, max - 2, max - 1);
  record.schedule.claimed_amount = max - 7;
  assert(repo.AppendSchedule(*tx, record));
  tx->Commit();

  auto verify_tx = repo.Begin();
  auto listed    = repo.ListSchedules(*verify_tx, beneficiary);
  assert(listed.size() == 1);
  assert(listed[0].schedule.total_amount == max);
  assert(listed[0].schedule.claimed_amount == max - 7);
  assert(listed[0].schedule.cliff_time == max - 2);
  assert(listed[0].schedule.ramp_end == max - 1);
  verify_tx->Commit();
}

void VerifyDeleteResetsIndexes(Repository& repo, const std::string& beneficiary) {
  auto tx = repo.Begin();
  for (int i = 0; i < 3; ++i) {
    auto record = MakeRecord(beneficiary, 10, 0, 10);
    assert(repo.AppendSchedule(*tx, record));
  }
  assert(repo.DeleteSchedules(*tx, beneficiary));
  assert(repo.ListSchedules(*tx, beneficiary).empty());

  const auto holders = repo.ListBeneficiaries(*tx);
  assert(std::find(holders.begin(), holders.end(), beneficiary) == holders.end());

  auto fresh = MakeRecord(beneficiary, 10, 0, 10);
  assert(repo.AppendSchedule(*tx, fresh));
  assert(fresh.schedule_index == 0);
  tx->Commit();
}

void VerifyGovernanceUpsert(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  GovernanceRecord record{.administrator = prefix + "-admin", .recovery_account = prefix + "-recovery", .updated_at_ms = NowMs()};
  assert(repo.PutGovernance(*tx, record));

  record.recovery_account = prefix + "-recovery-2";
  assert(repo.PutGovernance(*tx, record));
  assert(!tx->IsCommitted());
  tx->Commit();
  assert(tx->IsCommitted());

  auto verify_tx = repo.Begin();
  auto stored    = repo.GetGovernance(*verify_tx);
  assert(stored.has_value());
  assert(stored->administrator == prefix + "-admin");
  assert(stored->recovery_account == prefix + "-recovery-2");
  verify_tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& beneficiary) {
  {
    auto tx     = repo.Begin();
    auto record = MakeRecord(beneficiary, 10, 0, 10);
    assert(repo.AppendSchedule(*tx, record));
    tx->Rollback();
  }

  {
    // destroyed without commit
    auto tx     = repo.Begin();
    auto record = MakeRecord(beneficiary, 10, 0, 10);
    assert(repo.AppendSchedule(*tx, record));
  }

  auto check_tx = repo.Begin();
  assert(repo.ListSchedules(*check_tx, beneficiary).empty());
  check_tx->Commit();
}

void VerifyBalances(Repository& repo, const std::string& prefix) {
  const auto max     = std::numeric_limits<uint64_t>::max();
  const auto account = prefix + "-holder";

  {
    auto tx = repo.Begin();
    assert(repo.GetBalance(*tx, account) == 0);
    assert(repo.PutBalance(*tx, account, max));
    assert(repo.GetBalance(*tx, account) == max);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.PutBalance(*tx, account, 5));
    tx->Rollback();
  }

  auto verify_tx = repo.Begin();
  assert(repo.GetBalance(*verify_tx, account) == max);
  assert(repo.HasBalances(*verify_tx));
  assert(repo.PutBalance(*verify_tx, account, 0));
  assert(repo.GetBalance(*verify_tx, account) == 0);
  verify_tx->Commit();
}

void VerifyConcurrentAppends(Repository& repo, const std::string& beneficiary, bool supports_parallel_transactions) {
  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto r1 = MakeRecord(beneficiary, 10, 0, 10);
  assert(repo.AppendSchedule(*tx1, r1));
  tx1->Commit();

  // the second writer either sees the first commit or is refused
  bool second_committed = false;
  auto r2               = MakeRecord(beneficiary, 20, 0, 10);
  try {
    if (repo.AppendSchedule(*tx2, r2)) {
      tx2->Commit();
      second_committed = true;
    }
  } catch (const std::exception&) {
  }

  auto verify_tx = repo.Begin();
  auto listed    = repo.ListSchedules(*verify_tx, beneficiary);
  assert(listed.size() == (second_committed ? 2u : 1u));
  if (second_committed) {
    assert(listed[0].schedule_index != listed[1].schedule_index);
  }
  verify_tx->Commit();
}

// Two writers read-modify-write the same schedule. Whichever backend
// serializes them, every committed payout must show in the final row.
void VerifyNoLostUpdate(Repository& repo, const std::string& beneficiary) {
  {
    auto tx     = repo.Begin();
    auto record = MakeRecord(beneficiary, 1000, 0, 10);
    assert(repo.AppendSchedule(*tx, record));
    tx->Commit();
  }

  std::atomic<int> commits{0};
  auto             pay = [&](std::chrono::milliseconds hold) {
    try {
      auto tx     = repo.Begin();
      auto listed = repo.ListSchedules(*tx, beneficiary);
      std::this_thread::sleep_for(hold);
      listed[0].schedule.claimed_amount += 100;
      if (repo.UpdateSchedule(*tx, listed[0])) {
        tx->Commit();
        ++commits;
      }
    } catch (const std::exception& e) {
      std::cout << "  writer refused: " << e.what() << "\n";
    }
  };

  std::thread first(pay, std::chrono::milliseconds(200));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  std::thread second(pay, std::chrono::milliseconds(0));
  first.join();
  second.join();

  auto tx = repo.Begin();
  assert(commits.load() >= 1);
  assert(repo.ListSchedules(*tx, beneficiary)[0].schedule.claimed_amount == 100u * commits.load());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& beneficiary) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx     = repo->Begin();
    auto record = MakeRecord(beneficiary, 777, 5, 50);
    assert(repo->AppendSchedule(*tx, record));

    GovernanceRecord governance{.administrator = beneficiary + "-admin", .recovery_account = beneficiary + "-recovery", .updated_at_ms = 1};
    assert(repo->PutGovernance(*tx, governance));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto listed = repo->ListSchedules(*tx, beneficiary);
  assert(listed.size() == 1);
  assert(listed[0].schedule.total_amount == 777);
  assert(listed[0].schedule.ramp_end == 50);

  auto governance = repo->GetGovernance(*tx);
  assert(governance.has_value());
  assert(governance->administrator == beneficiary + "-admin");
  tx->Commit();
}

// Custody and schedules must come back together after a restart, and
// opening balances must not be granted a second time.
void VerifyLedgerSurvivesRestart(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto admin    = prefix + "-admin";
  const auto recovery = prefix + "-recovery";
  const auto alice    = prefix + "-alice";
  const auto custody  = prefix + "-custody";
  auto       clock    = std::make_shared<vesting::util::ManualClock>(0);
  auto       events   = std::make_shared<vesting::events::LoggingEventSink>();

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->PutGovernance(*tx, GovernanceRecord{.administrator = admin, .recovery_account = recovery, .updated_at_ms = NowMs()}));
    assert(repo->PutBalance(*tx, admin, 1000));
    tx->Commit();

    auto tokens = std::make_shared<StoreTokenLedger>(repo, custody);
    vesting::core::VestingLedger ledger(repo, tokens, events, clock);

    vesting::core::ScheduleRequest request;
    request.beneficiary     = alice;
    request.total_amount    = 1000;
    request.upfront_percent = 10;
    request.cliff_time      = 100;
    request.ramp_end        = 1100;
    ledger.CreateSchedule(admin, request);

    assert(tokens->CustodyBalance() == 1000);
    assert(tokens->BalanceOf(admin) == 0);
  }

  backend.restart(repo);

  auto tokens = std::make_shared<StoreTokenLedger>(repo, custody);
  assert(!tokens->Seed({{admin, 1000}}));
  assert(tokens->BalanceOf(admin) == 0);
  assert(tokens->CustodyBalance() == 1000);

  vesting::core::VestingLedger ledger(repo, tokens, events, clock);
  clock->Set(1100);
  assert(ledger.Claim(alice).total_paid == 1000);
  assert(tokens->BalanceOf(alice) == 1000);
  assert(tokens->CustodyBalance() == 0);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if VESTING_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("vesting_ledger_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    vesting::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
    return vesting::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}
#endif

#if VESTING_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("VESTING_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("VESTING_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    vesting::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
    return vesting::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // postgres keeps rows between runs, so every run gets its own names
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyAppendListUpdate(*repo, run + "-append");
  VerifyFullWidthValues(*repo, run + "-wide");
  VerifyDeleteResetsIndexes(*repo, run + "-delete");
  VerifyGovernanceUpsert(*repo, run + "-governance");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyBalances(*repo, run + "-balance");
  VerifyConcurrentAppends(*repo, run + "-concurrency", backend.supports_parallel_transactions);
  VerifyNoLostUpdate(*repo, run + "-lost-update");

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");
  VerifyLedgerSurvivesRestart(backend, run + "-restart");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if VESTING_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if VESTING_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "vesting_integration_repository_parity: pass\n";
  return 0;
}
