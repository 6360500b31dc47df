#pragma once

namespace vesting::db::sql {

/*
  SQLite statements and schema.

  Amounts and times are 64-bit unsigned. SQLite INTEGER is signed, so
  values are stored by bit pattern and cast back on read; nothing sums
  them inside SQL.
*/

// Not SQLITE_SCHEMA: <sqlite3.h> defines that name as a result code.
static constexpr const char* SQLITE_SCHEMA_DDL[] = {
    "CREATE TABLE IF NOT EXISTS vesting_schedule ("
    " beneficiary TEXT NOT NULL,"
    " schedule_index INTEGER NOT NULL,"
    " total_amount INTEGER NOT NULL,"
    " claimed_amount INTEGER NOT NULL,"
    " upfront_amount INTEGER NOT NULL,"
    " claimable_cache INTEGER NOT NULL,"
    " cliff_time INTEGER NOT NULL,"
    " ramp_start INTEGER NOT NULL,"
    " ramp_end INTEGER NOT NULL,"
    " PRIMARY KEY (beneficiary, schedule_index));",

    "CREATE TABLE IF NOT EXISTS vesting_governance ("
    " id INTEGER PRIMARY KEY CHECK (id = 1),"
    " administrator TEXT NOT NULL,"
    " recovery_account TEXT NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS vesting_balance ("
    " account TEXT PRIMARY KEY,"
    " amount INTEGER NOT NULL);",
};

static constexpr const char* SELECT_SCHEDULES =
    "SELECT beneficiary,schedule_index,total_amount,claimed_amount,upfront_amount,"
    "claimable_cache,cliff_time,ramp_start,ramp_end"
    " FROM vesting_schedule WHERE beneficiary=? ORDER BY schedule_index;";

static constexpr const char* COUNT_SCHEDULES =
    "SELECT COUNT(*) FROM vesting_schedule WHERE beneficiary=?;";

static constexpr const char* INSERT_SCHEDULE =
    "INSERT INTO vesting_schedule(beneficiary,schedule_index,total_amount,claimed_amount,"
    "upfront_amount,claimable_cache,cliff_time,ramp_start,ramp_end)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_SCHEDULE =
    "UPDATE vesting_schedule SET total_amount=?,claimed_amount=?,upfront_amount=?,"
    "claimable_cache=?,cliff_time=?,ramp_start=?,ramp_end=?"
    " WHERE beneficiary=? AND schedule_index=?;";

static constexpr const char* DELETE_SCHEDULES =
    "DELETE FROM vesting_schedule WHERE beneficiary=?;";

static constexpr const char* SELECT_BENEFICIARIES =
    "SELECT DISTINCT beneficiary FROM vesting_schedule ORDER BY beneficiary;";

// governance

static constexpr const char* SELECT_GOVERNANCE =
    "SELECT administrator,recovery_account,updated_at_ms FROM vesting_governance WHERE id=1;";

static constexpr const char* UPSERT_GOVERNANCE =
    "INSERT INTO vesting_governance(id,administrator,recovery_account,updated_at_ms)"
    " VALUES(1,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " administrator=excluded.administrator,"
    " recovery_account=excluded.recovery_account,"
    " updated_at_ms=excluded.updated_at_ms;";

// balances

static constexpr const char* SELECT_BALANCE =
    "SELECT amount FROM vesting_balance WHERE account=?;";

static constexpr const char* UPSERT_BALANCE =
    "INSERT INTO vesting_balance(account,amount) VALUES(?,?)"
    " ON CONFLICT(account) DO UPDATE SET amount=excluded.amount;";

static constexpr const char* ANY_BALANCE =
    "SELECT 1 FROM vesting_balance LIMIT 1;";

/*
  PostgreSQL schema. NUMERIC(20,0) holds the full unsigned 64-bit range.
*/

static constexpr const char* POSTGRES_SCHEMA_DDL[] = {
    "CREATE TABLE IF NOT EXISTS vesting_schedule ("
    " beneficiary TEXT NOT NULL,"
    " schedule_index BIGINT NOT NULL,"
    " total_amount NUMERIC(20,0) NOT NULL,"
    " claimed_amount NUMERIC(20,0) NOT NULL,"
    " upfront_amount NUMERIC(20,0) NOT NULL,"
    " claimable_cache NUMERIC(20,0) NOT NULL,"
    " cliff_time NUMERIC(20,0) NOT NULL,"
    " ramp_start NUMERIC(20,0) NOT NULL,"
    " ramp_end NUMERIC(20,0) NOT NULL,"
    " PRIMARY KEY (beneficiary, schedule_index));",

    "CREATE TABLE IF NOT EXISTS vesting_governance ("
    " id SMALLINT PRIMARY KEY CHECK (id = 1),"
    " administrator TEXT NOT NULL,"
    " recovery_account TEXT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS vesting_balance ("
    " account TEXT PRIMARY KEY,"
    " amount NUMERIC(20,0) NOT NULL);",
};

} // namespace vesting::db::sql
