#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <vector>

#include "internal/util/errors.hpp"
#include "support/ledger_harness.hpp"

namespace {

using namespace vesting::testing;
using vesting::core::LedgerLimits;
using vesting::core::ScheduleRequest;
using vesting::util::InvalidAmount;
using vesting::util::InvalidBeneficiary;
using vesting::util::InvalidPercent;
using vesting::util::InvalidTimeline;
using vesting::util::ResourceExhausted;
using vesting::util::TransferFailed;
using vesting::util::Unauthorized;

void TestCreateStoresScheduleAndPullsTokens() {
  auto h       = MakeHarness();
  auto created = h.ledger->CreateSchedule(kAdmin, Request(kAlice, 1000, 10, 100, 1100));

  assert(created.beneficiary() == kAlice);
  assert(created.schedule_index() == 0);
  assert(created.total_amount() == 1000);
  assert(created.claimed_amount() == 0);
  assert(created.upfront_amount() == 100);
  assert(created.claimable_cache() == 100);
  assert(created.cliff_time() == 100);
  assert(created.ramp_start() == 100);
  assert(created.ramp_end() == 1100);

  assert(h.balances->BalanceOf(kAdmin) == 1'000'000 - 1000);
  assert(h.balances->CustodyBalance() == 1000);

  assert(h.events->created.size() == 1);
  assert(h.events->created[0].beneficiary == kAlice);
  assert(h.events->created[0].upfront_amount == 100);

  auto second = h.ledger->CreateSchedule(kAdmin, Request(kAlice, 50, 0, 10, 20));
  assert(second.schedule_index() == 1);
}

void TestValidationRejectsBadRequests() {
  auto h = MakeHarness();

  assert(Throws<InvalidBeneficiary>([&] { h.ledger->CreateSchedule(kAdmin, Request("", 1000, 10, 100, 1100)); }));
  assert(Throws<InvalidBeneficiary>([&] { h.ledger->CreateSchedule(kAdmin, Request("0x0000000000", 1000, 10, 100, 1100)); }));
  assert(Throws<InvalidAmount>([&] { h.ledger->CreateSchedule(kAdmin, Request(kAlice, 0, 10, 100, 1100)); }));
  assert(Throws<InvalidPercent>([&] { h.ledger->CreateSchedule(kAdmin, Request(kAlice, 1000, 101, 100, 1100)); }));
  assert(Throws<InvalidTimeline>([&] { h.ledger->CreateSchedule(kAdmin, Request(kAlice, 1000, 10, 1100, 1100)); }));
  assert(Throws<InvalidTimeline>([&] { h.ledger->CreateSchedule(kAdmin, Request(kAlice, 1000, 10, 1200, 1100)); }));

  assert(h.ledger->ListSchedules(kAlice, 0).empty());
  assert(h.balances->CustodyBalance() == 0);
  assert(h.events->created.empty());
}

void TestBoundaryValuesAreAccepted() {
  auto h = MakeHarness();
  assert(h.ledger->CreateSchedule(kAdmin, Request(kAlice, 1, 100, 0, 1)).upfront_amount() == 1);
  assert(h.ledger->CreateSchedule(kAdmin, Request(kAlice, 1, 0, 0, 1)).upfront_amount() == 0);
}

void TestOnlyAdministratorCreates() {
  auto h = MakeHarness();
  Fund(*h.repository, kBob, 10'000);

  assert(Throws<Unauthorized>([&] { h.ledger->CreateSchedule(kBob, Request(kAlice, 1000, 10, 100, 1100)); }));
  assert(Throws<Unauthorized>([&] { h.ledger->CreateSchedules(kBob, {Request(kAlice, 1000, 10, 100, 1100)}); }));
  assert(h.ledger->ListSchedules(kAlice, 0).empty());
  assert(h.balances->BalanceOf(kBob) == 10'000);
}

void TestTransferFailureRecordsNothing() {
  auto h = MakeHarness({}, 500);

  // admin holds 500, grant needs 1000
  assert(Throws<TransferFailed>([&] { h.ledger->CreateSchedule(kAdmin, Request(kAlice, 1000, 10, 100, 1100)); }));
  assert(h.ledger->ListSchedules(kAlice, 0).empty());
  assert(h.balances->BalanceOf(kAdmin) == 500);

  h.tokens->fail_into = true;
  assert(Throws<TransferFailed>([&] { h.ledger->CreateSchedule(kAdmin, Request(kAlice, 100, 10, 100, 1100)); }));
  assert(h.ledger->ListSchedules(kAlice, 0).empty());
  assert(h.events->created.empty());
}

void TestBatchCreatesAllEntries() {
  auto h = MakeHarness();

  const auto indexes = h.ledger->CreateSchedules(kAdmin, {Request(kAlice, 1000, 10, 100, 1100), Request(kBob, 200, 0, 0, 10),
                                                          Request(kAlice, 300, 50, 10, 20)});
  assert((indexes == std::vector<uint64_t>{0, 0, 1}));
  assert(h.ledger->ListSchedules(kAlice, 0).size() == 2);
  assert(h.ledger->ListSchedules(kBob, 0).size() == 1);
  assert(h.balances->CustodyBalance() == 1500);
  assert(h.events->created.size() == 3);
}

void TestBatchIsAllOrNothing() {
  auto h = MakeHarness();

  // last entry has an inverted timeline
  assert(Throws<InvalidTimeline>([&] {
    h.ledger->CreateSchedules(kAdmin, {Request(kAlice, 1000, 10, 100, 1100), Request(kBob, 200, 0, 0, 10), Request(kBob, 300, 0, 20, 10)});
  }));
  assert(h.ledger->ListSchedules(kAlice, 0).empty());
  assert(h.ledger->ListSchedules(kBob, 0).empty());
  assert(h.balances->CustodyBalance() == 0);

  h.tokens->fail_into = true;
  assert(Throws<TransferFailed>([&] { h.ledger->CreateSchedules(kAdmin, {Request(kAlice, 1000, 10, 100, 1100), Request(kBob, 200, 0, 0, 10)}); }));
  assert(h.ledger->ListSchedules(kAlice, 0).empty());
  assert(h.ledger->ListSchedules(kBob, 0).empty());
  assert(h.events->created.empty());
}

void TestBatchRejectsEmptyAndOverflow() {
  auto h = MakeHarness();

  assert(Throws<InvalidAmount>([&] { h.ledger->CreateSchedules(kAdmin, {}); }));

  const auto max = std::numeric_limits<uint64_t>::max();
  assert(Throws<InvalidAmount>([&] { h.ledger->CreateSchedules(kAdmin, {Request(kAlice, max, 0, 0, 10), Request(kBob, 1, 0, 0, 10)}); }));
  assert(h.ledger->ListSchedules(kAlice, 0).empty());
}

void TestLimitsAreEnforced() {
  LedgerLimits limits;
  limits.max_schedules_per_beneficiary = 2;
  limits.max_batch_size                = 3;
  auto h                               = MakeHarness(limits);

  h.ledger->CreateSchedule(kAdmin, Request(kAlice, 10, 0, 0, 10));
  h.ledger->CreateSchedule(kAdmin, Request(kAlice, 10, 0, 0, 10));
  assert(Throws<ResourceExhausted>([&] { h.ledger->CreateSchedule(kAdmin, Request(kAlice, 10, 0, 0, 10)); }));

  // counts within the batch add to what is already stored
  h.ledger->CreateSchedule(kAdmin, Request(kBob, 10, 0, 0, 10));
  assert(Throws<ResourceExhausted>(
      [&] { h.ledger->CreateSchedules(kAdmin, {Request(kBob, 10, 0, 0, 10), Request(kBob, 10, 0, 0, 10)}); }));
  assert(h.ledger->ListSchedules(kBob, 0).size() == 1);

  const std::vector<ScheduleRequest> too_many(4, Request("0x0000000000000000000000000000000000000c0c", 10, 0, 0, 10));
  assert(Throws<ResourceExhausted>([&] { h.ledger->CreateSchedules(kAdmin, too_many); }));
  assert(h.balances->CustodyBalance() == 30);
}

void TestCustodyCannotBeBeneficiary() {
  auto h = MakeHarness();

  assert(Throws<InvalidBeneficiary>([&] { h.ledger->CreateSchedule(kAdmin, Request(kCustody, 1000, 10, 100, 1100)); }));
  assert(Throws<InvalidBeneficiary>(
      [&] { h.ledger->CreateSchedules(kAdmin, {Request(kAlice, 1000, 10, 100, 1100), Request(kCustody, 1000, 10, 100, 1100)}); }));
  assert(h.ledger->ListSchedules(kCustody, 0).empty());
  assert(h.ledger->ListSchedules(kAlice, 0).empty());
  assert(h.balances->CustodyBalance() == 0);
  assert(h.balances->BalanceOf(kAdmin) == 1'000'000);
}

} // namespace

int main() {
  TestCreateStoresScheduleAndPullsTokens();
  TestValidationRejectsBadRequests();
  TestBoundaryValuesAreAccepted();
  TestOnlyAdministratorCreates();
  TestTransferFailureRecordsNothing();
  TestBatchCreatesAllEntries();
  TestBatchIsAllOrNothing();
  TestBatchRejectsEmptyAndOverflow();
  TestLimitsAreEnforced();
  TestCustodyCannotBeBeneficiary();

  std::cout << "vesting_unit_schedule_creation: pass\n";
  return 0;
}
