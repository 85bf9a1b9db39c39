#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace warehouse::db::sqlite {

using warehouse::db::ErrorCode;
using warehouse::db::Result;

namespace {

/*
  Owns one prepared statement for the duration of a call.
*/
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) st_ = nullptr;
    }
    ~Statement() {
        if (st_) sqlite3_finalize(st_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }
    explicit operator bool() const { return st_ != nullptr; }

private:
    sqlite3_stmt* st_ = nullptr;
};

[[noreturn]] void ThrowReadError(sqlite3* db, const char* what) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<std::int64_t>& v) {
    if (v) {
        BindI64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::optional<std::int64_t> ColOptionalI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColI64(st, col);
}

model::BinRecord ReadBin(sqlite3_stmt* st) {
    model::BinRecord r;
    r.bin_id        = ColI64(st, 0);
    r.capacity      = ColI64(st, 1);
    r.current_usage = ColI64(st, 2);
    r.location_code = ColText(st, 3);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Bins
// ------------------------------------------------------------------

Result SqliteRepository::InsertBin(Transaction& t, const model::BinRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_BIN);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.bin_id);
    BindI64(st.get(), 2, r.capacity);
    BindI64(st.get(), 3, r.current_usage);
    BindText(st.get(), 4, r.location_code);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BinRecord>
SqliteRepository::GetBin(Transaction& t, std::int64_t bin_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_BIN);
    if (!st) ThrowReadError(db, "select bin");

    BindI64(st.get(), 1, bin_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowReadError(db, "select bin");
    return ReadBin(st.get());
}

std::vector<model::BinRecord> SqliteRepository::ListBins(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::BinRecord> records;
    Statement st(db, sql::SELECT_BINS);
    if (!st) ThrowReadError(db, "list bins");

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        records.push_back(ReadBin(st.get()));
    }
    if (rc != SQLITE_DONE) ThrowReadError(db, "list bins");
    return records;
}

Result SqliteRepository::UpdateBinUsage(Transaction& t, std::int64_t bin_id, std::int64_t current_usage) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_BIN_USAGE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, current_usage);
    BindI64(st.get(), 2, bin_id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "bin " + std::to_string(bin_id));
    return result;
}

Result SqliteRepository::DeleteAllBins(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_BINS);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Shipment log
// ------------------------------------------------------------------

Result SqliteRepository::InsertShipmentLog(Transaction& t, const model::ShipmentLogRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_SHIPMENT_LOG);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.tracking_id);
    BindOptionalI64(st.get(), 2, r.bin_id);
    BindText(st.get(), 3, r.timestamp);
    BindText(st.get(), 4, r.status);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ShipmentLogRecord> SqliteRepository::ListShipmentLogs(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::ShipmentLogRecord> records;
    Statement st(db, sql::SELECT_SHIPMENT_LOGS);
    if (!st) ThrowReadError(db, "list shipment logs");

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::ShipmentLogRecord r;
        r.tracking_id = ColText(st.get(), 0);
        r.bin_id      = ColOptionalI64(st.get(), 1);
        r.timestamp   = ColText(st.get(), 2);
        r.status      = ColText(st.get(), 3);
        records.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) ThrowReadError(db, "list shipment logs");
    return records;
}

} // namespace warehouse::db::sqlite
