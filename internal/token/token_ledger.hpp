#pragma once

#include "internal/db/api/transaction.hpp"
#include "internal/model/address.hpp"
#include "internal/model/schedule.hpp"

namespace vesting::token {

/*
  Fungible token ledger as seen by the vesting ledger.

  The vesting ledger holds tokens in custody. TransferInto moves tokens
  from an account into custody, TransferOut moves them from custody to
  an account. Both run inside the caller's open store transaction and
  take effect only when it commits. A false return is a hard failure of
  the calling operation; it is never retried.

  Custody never transfers to itself.

  Implementations may call back into the vesting ledger from inside a
  transfer. The vesting ledger rejects such calls.
*/
class TokenLedger {
 public:
  virtual ~TokenLedger() = default;

  virtual bool TransferInto(db::Transaction& tx, const model::Address& from, model::Amount amount) = 0;
  virtual bool TransferOut(db::Transaction& tx, const model::Address& to, model::Amount amount)    = 0;

  // Committed balances. Must not be called while the calling thread
  // holds a store transaction.
  virtual model::Amount BalanceOf(const model::Address& account) const = 0;
  virtual model::Amount CustodyBalance() const                          = 0;

  virtual const model::Address& CustodyAccount() const = 0;
};

} // namespace vesting::token
