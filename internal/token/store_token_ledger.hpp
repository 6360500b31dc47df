#pragma once

#include <map>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "token_ledger.hpp"

namespace vesting::token {

/*
  Balance book kept in the repository next to the schedules.

  A transfer reads and writes balance rows through the caller's
  transaction, so schedules and custody commit or roll back together
  and survive restarts. Transfers fail on insufficient balance, on
  overflow of the receiving balance and when both sides are custody.
*/
class StoreTokenLedger final : public TokenLedger {
 public:
  StoreTokenLedger(std::shared_ptr<db::Repository> repository, model::Address custody_account);

  bool TransferInto(db::Transaction& tx, const model::Address& from, model::Amount amount) override;
  bool TransferOut(db::Transaction& tx, const model::Address& to, model::Amount amount) override;

  model::Amount BalanceOf(const model::Address& account) const override;
  model::Amount CustodyBalance() const override;

  const model::Address& CustodyAccount() const override {
    return custody_account_;
  }

  // Writes the opening balances on a store that has none. Returns false
  // and leaves the store alone once any balance has been recorded, so a
  // restart never grants them twice.
  bool Seed(const std::map<model::Address, model::Amount>& balances);

 private:
  bool Move(db::Transaction& tx, const model::Address& from, const model::Address& to, model::Amount amount);

  std::shared_ptr<db::Repository> repository_;
  const model::Address            custody_account_;
};

} // namespace vesting::token
