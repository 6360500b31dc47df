#include "store_token_ledger.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace vesting::token {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (!result) {
    throw util::StorageError(result.message.empty() ? context : context + ": " + result.message);
  }
}

} // namespace

StoreTokenLedger::StoreTokenLedger(std::shared_ptr<db::Repository> repository, model::Address custody_account)
    : repository_(std::move(repository)), custody_account_(std::move(custody_account)) {
  if (!repository_) {
    throw std::invalid_argument("StoreTokenLedger requires a repository");
  }
  if (custody_account_.empty()) {
    throw std::invalid_argument("custody account must be named");
  }
}

bool StoreTokenLedger::TransferInto(db::Transaction& tx, const model::Address& from, model::Amount amount) {
  return Move(tx, from, custody_account_, amount);
}

bool StoreTokenLedger::TransferOut(db::Transaction& tx, const model::Address& to, model::Amount amount) {
  return Move(tx, custody_account_, to, amount);
}

bool StoreTokenLedger::Move(db::Transaction& tx, const model::Address& from, const model::Address& to, model::Amount amount) {
  if (from == to) {
    return false;
  }

  const auto from_balance = repository_->GetBalance(tx, from);
  if (from_balance < amount) {
    return false;
  }
  const auto to_balance = repository_->GetBalance(tx, to);
  if (to_balance > std::numeric_limits<model::Amount>::max() - amount) {
    return false;
  }

  ThrowIfDbError(repository_->PutBalance(tx, from, from_balance - amount), "debit " + from);
  ThrowIfDbError(repository_->PutBalance(tx, to, to_balance + amount), "credit " + to);
  return true;
}

model::Amount StoreTokenLedger::BalanceOf(const model::Address& account) const {
  auto tx = repository_->Begin();
  return repository_->GetBalance(*tx, account);
}

model::Amount StoreTokenLedger::CustodyBalance() const {
  return BalanceOf(custody_account_);
}

bool StoreTokenLedger::Seed(const std::map<model::Address, model::Amount>& balances) {
  auto tx = repository_->Begin();
  if (repository_->HasBalances(*tx)) {
    return false;
  }

  for (const auto& [account, amount] : balances) {
    ThrowIfDbError(repository_->PutBalance(*tx, account, amount), "seed balance of " + account);
  }
  // custody gets a row too, so an empty seed still marks the store
  if (balances.find(custody_account_) == balances.end()) {
    ThrowIfDbError(repository_->PutBalance(*tx, custody_account_, 0), "seed custody balance");
  }
  tx->Commit();
  return true;
}

} // namespace vesting::token
