#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "support/ledger_harness.hpp"

namespace {

using namespace vesting::testing;
using vesting::util::InvalidAdministrator;
using vesting::util::InvalidRecoveryAccount;
using vesting::util::Unauthorized;

void TestBootstrapSeedsOnce() {
  auto h = MakeHarness();

  auto governance = h.ledger->Governance();
  assert(governance.administrator() == kAdmin);
  assert(governance.recovery_account() == kRecovery);

  // a restart with different configuration keeps the stored record
  auto restarted = std::make_shared<vesting::core::VestingLedger>(h.repository, h.tokens, h.events, h.clock);
  restarted->Bootstrap(kBob, kAlice);
  assert(restarted->Governance().administrator() == kAdmin);
  assert(restarted->Governance().recovery_account() == kRecovery);
}

void TestBootstrapRejectsNullAddresses() {
  auto repository = std::make_shared<vesting::db::memory::MemoryRepository>();
  auto balances   = std::make_shared<vesting::token::StoreTokenLedger>(repository, kCustody);
  auto ledger     = std::make_shared<vesting::core::VestingLedger>(repository, balances, std::make_shared<RecordingEventSink>(),
                                                               std::make_shared<vesting::util::ManualClock>());

  assert(Throws<InvalidAdministrator>([&] { ledger->Bootstrap("", kRecovery); }));
  assert(Throws<InvalidRecoveryAccount>([&] { ledger->Bootstrap(kAdmin, "0x0000"); }));
  assert(Throws<vesting::util::StorageError>([&] { ledger->Governance(); }));
}

void TestMissingDependencyIsRejected() {
  auto repository = std::make_shared<vesting::db::memory::MemoryRepository>();
  assert(Throws<std::invalid_argument>([&] {
    vesting::core::VestingLedger ledger(repository, nullptr, std::make_shared<RecordingEventSink>(),
                                        std::make_shared<vesting::util::ManualClock>());
  }));
}

void TestSetRecoveryAccount() {
  auto h = MakeHarness();

  auto updated = h.ledger->SetRecoveryAccount(kAdmin, kBob);
  assert(updated.recovery_account() == kBob);
  assert(h.ledger->Governance().recovery_account() == kBob);

  assert(h.events->recovery_changes.size() == 1);
  assert(h.events->recovery_changes[0].previous == kRecovery);
  assert(h.events->recovery_changes[0].current == kBob);

  assert(Throws<InvalidRecoveryAccount>([&] { h.ledger->SetRecoveryAccount(kAdmin, "0x0000000000000000000000000000000000000000"); }));
  assert(Throws<Unauthorized>([&] { h.ledger->SetRecoveryAccount(kBob, kBob); }));
  assert(h.ledger->Governance().recovery_account() == kBob);
}

void TestTransferAdministrator() {
  auto h = MakeHarness();

  h.ledger->TransferAdministrator(kAdmin, kBob);
  assert(h.ledger->IsAdministrator(kBob));
  assert(!h.ledger->IsAdministrator(kAdmin));
  assert(h.events->admin_changes.size() == 1);
  assert(h.events->admin_changes[0].previous == kAdmin);

  // the previous administrator lost every privilege
  assert(Throws<Unauthorized>([&] { h.ledger->TransferAdministrator(kAdmin, kAdmin); }));
  assert(Throws<Unauthorized>([&] { h.ledger->CreateSchedule(kAdmin, Request(kAlice, 10, 0, 0, 10)); }));
  assert(Throws<InvalidAdministrator>([&] { h.ledger->TransferAdministrator(kBob, ""); }));
  assert(!h.ledger->IsAdministrator(""));
}

void TestCustodyHoldsNoGovernanceRole() {
  auto h = MakeHarness();

  assert(Throws<InvalidAdministrator>([&] { h.ledger->TransferAdministrator(kAdmin, kCustody); }));
  assert(Throws<InvalidRecoveryAccount>([&] { h.ledger->SetRecoveryAccount(kAdmin, kCustody); }));
  assert(h.ledger->Governance().administrator() == kAdmin);
  assert(h.ledger->Governance().recovery_account() == kRecovery);
  assert(h.events->admin_changes.empty());
  assert(h.events->recovery_changes.empty());

  auto repository = std::make_shared<vesting::db::memory::MemoryRepository>();
  auto balances   = std::make_shared<vesting::token::StoreTokenLedger>(repository, kCustody);
  auto fresh      = std::make_shared<vesting::core::VestingLedger>(repository, balances, std::make_shared<RecordingEventSink>(),
                                                              std::make_shared<vesting::util::ManualClock>());
  assert(Throws<InvalidAdministrator>([&] { fresh->Bootstrap(kCustody, kRecovery); }));
  assert(Throws<InvalidRecoveryAccount>([&] { fresh->Bootstrap(kAdmin, kCustody); }));
}

void TestStatsTrackCommittedAndClaimed() {
  auto h = MakeHarness();
  h.ledger->CreateSchedule(kAdmin, Request(kAlice, 1000, 10, 100, 1100));
  h.ledger->CreateSchedule(kAdmin, Request(kBob, 400, 0, 0, 100));
  h.ledger->CreateSchedule(kAdmin, Request(kBob, 100, 0, 0, 100));

  h.clock->Set(600);
  h.ledger->Claim(kAlice);

  const auto stats = h.ledger->Stats();
  assert(stats.beneficiaries() == 2);
  assert(stats.schedules() == 3);
  assert(stats.total_committed() == 1500);
  assert(stats.total_claimed() == 550);
  assert(stats.outstanding() == 950);
  assert(stats.custody_balance() == 950);
}

} // namespace

int main() {
  TestBootstrapSeedsOnce();
  TestBootstrapRejectsNullAddresses();
  TestMissingDependencyIsRejected();
  TestSetRecoveryAccount();
  TestTransferAdministrator();
  TestCustodyHoldsNoGovernanceRole();
  TestStatsTrackCommittedAndClaimed();

  std::cout << "vesting_unit_governance: pass\n";
  return 0;
}
