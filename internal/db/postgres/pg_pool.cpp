#include "pg_pool.hpp"

namespace vesting::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("list_schedules",
               "SELECT beneficiary,schedule_index,total_amount,claimed_amount,upfront_amount,"
               "claimable_cache,cliff_time,ramp_start,ramp_end "
               "FROM vesting_schedule WHERE beneficiary=$1 ORDER BY schedule_index FOR UPDATE");

  conn.prepare("count_schedules", "SELECT COUNT(*) FROM vesting_schedule WHERE beneficiary=$1");

  conn.prepare("insert_schedule",
               "INSERT INTO vesting_schedule(beneficiary,schedule_index,total_amount,claimed_amount,"
               "upfront_amount,claimable_cache,cliff_time,ramp_start,ramp_end) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("update_schedule",
               "UPDATE vesting_schedule SET total_amount=$3,claimed_amount=$4,upfront_amount=$5,"
               "claimable_cache=$6,cliff_time=$7,ramp_start=$8,ramp_end=$9 "
               "WHERE beneficiary=$1 AND schedule_index=$2");

  conn.prepare("delete_schedules", "DELETE FROM vesting_schedule WHERE beneficiary=$1");

  conn.prepare("list_beneficiaries", "SELECT DISTINCT beneficiary FROM vesting_schedule ORDER BY beneficiary COLLATE \"C\"");

  conn.prepare("get_governance", "SELECT administrator,recovery_account,updated_at_ms FROM vesting_governance WHERE id=1");

  conn.prepare("put_governance",
               "INSERT INTO vesting_governance(id,administrator,recovery_account,updated_at_ms) "
               "VALUES(1,$1,$2,$3) "
               "ON CONFLICT(id) DO UPDATE SET administrator=EXCLUDED.administrator,"
               "recovery_account=EXCLUDED.recovery_account,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("lock_account", "SELECT pg_advisory_xact_lock(hashtextextended($1::text, 0))");

  conn.prepare("get_balance", "SELECT amount FROM vesting_balance WHERE account=$1");

  conn.prepare("put_balance",
               "INSERT INTO vesting_balance(account,amount) VALUES($1,$2) "
               "ON CONFLICT(account) DO UPDATE SET amount=EXCLUDED.amount");

  conn.prepare("any_balance", "SELECT 1 FROM vesting_balance LIMIT 1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace vesting::db::postgres
