#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace vesting::db::sqlite {

using vesting::db::ErrorCode;
using vesting::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    if (st) sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

// Reads have no Result channel, so a failed prepare or step surfaces as
// an exception for the engine to translate.
Statement PrepareOrThrow(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  if (!st) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Binds the seven schedule fields starting at idx.
void BindSchedule(sqlite3_stmt* st, int idx, const ::vesting::model::Schedule& s) {
  BindU64(st, idx++, s.total_amount);
  BindU64(st, idx++, s.claimed_amount);
  BindU64(st, idx++, s.upfront_amount);
  BindU64(st, idx++, s.claimable_cache);
  BindU64(st, idx++, s.cliff_time);
  BindU64(st, idx++, s.ramp_start);
  BindU64(st, idx, s.ramp_end);
}

model::ScheduleRecord ReadSchedule(sqlite3_stmt* st) {
  model::ScheduleRecord r;
  r.beneficiary                = ColText(st, 0);
  r.schedule_index             = ColU64(st, 1);
  r.schedule.total_amount      = ColU64(st, 2);
  r.schedule.claimed_amount    = ColU64(st, 3);
  r.schedule.upfront_amount    = ColU64(st, 4);
  r.schedule.claimable_cache   = ColU64(st, 5);
  r.schedule.cliff_time        = ColU64(st, 6);
  r.schedule.ramp_start        = ColU64(st, 7);
  r.schedule.ramp_end          = ColU64(st, 8);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

std::vector<model::ScheduleRecord> SqliteRepository::ListSchedules(Transaction& t, const std::string& beneficiary) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_SCHEDULES);
  BindText(st.get(), 1, beneficiary);

  std::vector<model::ScheduleRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadSchedule(st.get()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

Result SqliteRepository::AppendSchedule(Transaction& t, model::ScheduleRecord& r) {
  auto* db = TX(t).Handle();

  auto count = Prepare(db, sql::COUNT_SCHEDULES);
  if (!count) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(count.get(), 1, r.beneficiary);
  int rc = sqlite3_step(count.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);
  const uint64_t next_index = ColU64(count.get(), 0);

  auto st = Prepare(db, sql::INSERT_SCHEDULE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.beneficiary);
  BindU64(st.get(), 2, next_index);
  BindSchedule(st.get(), 3, r.schedule);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.schedule_index = next_index;
  return Result::Ok();
}

Result SqliteRepository::UpdateSchedule(Transaction& t, const model::ScheduleRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_SCHEDULE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSchedule(st.get(), 1, r.schedule);
  BindText(st.get(), 8, r.beneficiary);
  BindU64(st.get(), 9, r.schedule_index);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "schedule " + r.beneficiary + "#" + std::to_string(r.schedule_index));
  }
  return Result::Ok();
}

Result SqliteRepository::DeleteSchedules(Transaction& t, const std::string& beneficiary) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::DELETE_SCHEDULES);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, beneficiary);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<std::string> SqliteRepository::ListBeneficiaries(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_BENEFICIARIES);

  std::vector<std::string> out;
  int                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ColText(st.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

// ------------------------------------------------------------------
// Governance
// ------------------------------------------------------------------

std::optional<model::GovernanceRecord> SqliteRepository::GetGovernance(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_GOVERNANCE);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }

  model::GovernanceRecord r;
  r.administrator    = ColText(st.get(), 0);
  r.recovery_account = ColText(st.get(), 1);
  r.updated_at_ms    = ColU64(st.get(), 2);
  return r;
}

Result SqliteRepository::PutGovernance(Transaction& t, const model::GovernanceRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPSERT_GOVERNANCE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.administrator);
  BindText(st.get(), 2, r.recovery_account);
  BindU64(st.get(), 3, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

uint64_t SqliteRepository::GetBalance(Transaction& t, const std::string& account) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_BALANCE);
  BindText(st.get(), 1, account);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return 0;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return ColU64(st.get(), 0);
}

Result SqliteRepository::PutBalance(Transaction& t, const std::string& account, uint64_t amount) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPSERT_BALANCE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, account);
  BindU64(st.get(), 2, amount);
  return Translate(db, sqlite3_step(st.get()));
}

bool SqliteRepository::HasBalances(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::ANY_BALANCE);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return rc == SQLITE_ROW;
}

} // namespace vesting::db::sqlite
