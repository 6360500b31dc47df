#include <grpcpp/grpcpp.h>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "vesting/ledger/v1.hpp"

using namespace vesting::ledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  vestingctl <addr> <caller> create <beneficiary> <total> <upfront_percent> <cliff_time> <ramp_end>\n"
            << "  vestingctl <addr> <caller> create-batch <beneficiary:total:percent:cliff:ramp_end>...\n"
            << "  vestingctl <addr> <caller> claim\n"
            << "  vestingctl <addr> <caller> preview <beneficiary> [at]\n"
            << "  vestingctl <addr> <caller> list <beneficiary> [at]\n"
            << "  vestingctl <addr> <caller> recover <beneficiary>\n"
            << "  vestingctl <addr> <caller> set-recovery <account>\n"
            << "  vestingctl <addr> <caller> transfer-admin <administrator>\n"
            << "  vestingctl <addr> <caller> governance\n"
            << "  vestingctl <addr> <caller> stats\n";
}

static std::optional<uint64_t> ParseU64(const std::string& value) {
  uint64_t   out = 0;
  const auto res = std::from_chars(value.data(), value.data() + value.size(), out);
  if (res.ec != std::errc{} || res.ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return out;
}

static uint64_t RequireU64(const std::string& value, const char* what) {
  auto parsed = ParseU64(value);
  if (!parsed) {
    throw std::invalid_argument(std::string("invalid ") + what + ": " + value);
  }
  return *parsed;
}

static std::vector<std::string> Split(const std::string& value, char sep) {
  std::vector<std::string> parts;
  std::stringstream        in(value);
  std::string              part;
  while (std::getline(in, part, sep)) {
    parts.push_back(part);
  }
  return parts;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static void PrintGovernance(const Governance& governance) {
  std::cout << "administrator=" << governance.administrator() << "\n";
  std::cout << "recovery_account=" << governance.recovery_account() << "\n";
}

static int Run(int argc, char** argv) {
  const std::string addr   = argv[1];
  const std::string caller = argv[2];
  const std::string cmd    = argv[3];

  auto channel    = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub       = VestingService::NewStub(channel);
  auto admin_stub = VestingAdminService::NewStub(channel);

  grpc::ClientContext ctx;
  ctx.AddMetadata("x-vesting-caller", caller);

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 9) return 1;

    CreateScheduleRequest req;
    req.set_beneficiary(argv[4]);
    req.set_total_amount(RequireU64(argv[5], "total"));
    req.set_upfront_percent(static_cast<uint32_t>(RequireU64(argv[6], "upfront_percent")));
    req.set_cliff_time(RequireU64(argv[7], "cliff_time"));
    req.set_ramp_end(RequireU64(argv[8], "ramp_end"));

    CreateScheduleResponse resp;
    auto                   status = stub->CreateSchedule(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "schedule_index=" << resp.schedule_index() << "\n";
    std::cout << "upfront_amount=" << resp.schedule().upfront_amount() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "create-batch") {
    if (argc < 5) return 1;

    CreateSchedulesRequest req;
    for (int i = 4; i < argc; ++i) {
      const auto fields = Split(argv[i], ':');
      if (fields.size() != 5) {
        std::cerr << "expected beneficiary:total:percent:cliff:ramp_end, got " << argv[i] << "\n";
        return 1;
      }
      req.add_beneficiaries(fields[0]);
      req.add_total_amounts(RequireU64(fields[1], "total"));
      req.add_upfront_percents(static_cast<uint32_t>(RequireU64(fields[2], "upfront_percent")));
      req.add_cliff_times(RequireU64(fields[3], "cliff_time"));
      req.add_ramp_ends(RequireU64(fields[4], "ramp_end"));
    }

    CreateSchedulesResponse resp;
    auto                    status = stub->CreateSchedules(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (int i = 0; i < resp.schedule_indexes_size(); ++i) {
      std::cout << req.beneficiaries(i) << " schedule_index=" << resp.schedule_indexes(i) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "claim") {
    ClaimRequest  req;
    ClaimResponse resp;
    auto          status = stub->Claim(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "total_paid=" << resp.total_paid() << "\n";
    std::cout << "claimed_at=" << resp.claimed_at() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "preview") {
    if (argc < 5) return 1;

    PreviewClaimableRequest req;
    req.set_beneficiary(argv[4]);
    if (argc >= 6) req.set_at(RequireU64(argv[5], "at"));

    PreviewClaimableResponse resp;
    auto                     status = stub->PreviewClaimable(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "claimable=" << resp.claimable_amount() << " at=" << resp.evaluated_at() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (argc < 5) return 1;

    ListSchedulesRequest req;
    req.set_beneficiary(argv[4]);
    if (argc >= 6) req.set_at(RequireU64(argv[5], "at"));

    ListSchedulesResponse resp;
    auto                  status = stub->ListSchedules(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.schedules()) {
      const auto& s = entry.schedule();
      std::cout << "#" << s.schedule_index() << " total=" << s.total_amount() << " claimed=" << s.claimed_amount()
                << " upfront=" << s.upfront_amount() << " cliff=" << s.cliff_time() << " ramp_end=" << s.ramp_end()
                << " unlocked=" << entry.unlocked_amount() << " claimable=" << entry.claimable_amount() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "recover") {
    if (argc < 5) return 1;

    RecoverRequest req;
    req.set_beneficiary(argv[4]);

    RecoverResponse resp;
    auto            status = stub->Recover(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "recovered=" << resp.amount_recovered() << " to=" << resp.recovery_account() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-recovery") {
    if (argc < 5) return 1;

    SetRecoveryAccountRequest req;
    req.set_recovery_account(argv[4]);

    Governance resp;
    auto       status = admin_stub->SetRecoveryAccount(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintGovernance(resp);
    return 0;
  }

  if (cmd == "transfer-admin") {
    if (argc < 5) return 1;

    TransferAdministratorRequest req;
    req.set_administrator(argv[4]);

    Governance resp;
    auto       status = admin_stub->TransferAdministrator(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintGovernance(resp);
    return 0;
  }

  if (cmd == "governance") {
    google::protobuf::Empty req;
    Governance              resp;
    auto                    status = admin_stub->GetGovernance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintGovernance(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;
    auto          status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& stats = resp.stats();
    std::cout << "beneficiaries=" << stats.beneficiaries() << "\n";
    std::cout << "schedules=" << stats.schedules() << "\n";
    std::cout << "total_committed=" << stats.total_committed() << "\n";
    std::cout << "total_claimed=" << stats.total_claimed() << "\n";
    std::cout << "outstanding=" << stats.outstanding() << "\n";
    std::cout << "custody_balance=" << stats.custody_balance() << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  try {
    return Run(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
}
