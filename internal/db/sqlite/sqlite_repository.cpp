#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace bazaar::db::sqlite {

using bazaar::db::ErrorCode;
using bazaar::db::Result;

static int BindParam(sqlite3_stmt* st, int idx, const sql::Param& p) {
    if (const auto* s = std::get_if<std::string>(&p))
        return sqlite3_bind_text(st, idx, s->c_str(), -1, SQLITE_TRANSIENT);
    if (const auto* i = std::get_if<int64_t>(&p))
        return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*i));
    return sqlite3_bind_null(st, idx);
}

static sql::Row ReadRow(sqlite3_stmt* st) {
    sql::Row row;
    const int cols = sqlite3_column_count(st);
    for (int c = 0; c < cols; ++c) {
        switch (sqlite3_column_type(st, c)) {
            case SQLITE_NULL:
                row.Append(nullptr);
                break;
            case SQLITE_INTEGER:
                row.Append(static_cast<int64_t>(sqlite3_column_int64(st, c)));
                break;
            default: {
                const unsigned char* t = sqlite3_column_text(st, c);
                row.Append(std::string(t ? reinterpret_cast<const char*>(t) : ""));
                break;
            }
        }
    }
    return row;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db, sql::Queries queries)
    : db_(std::move(db)), queries_(std::move(queries)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    // extended codes carry the primary code in the low byte
    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::Execute(Transaction& t, const sql::Statement& statement, sql::ResultSet* rows) {
    if (auto arity = CheckArity(statement); !arity) return arity;

    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    int rc = db_->Cached(statement.id, queries_.Sql(statement.id), &st);
    if (rc != SQLITE_OK) return Translate(db, rc);

    // cached statements go back clean whatever happens below
    struct ResetOnExit {
        sqlite3_stmt* st;
        ~ResetOnExit() {
            sqlite3_reset(st);
            sqlite3_clear_bindings(st);
        }
    } reset{st};

    for (std::size_t i = 0; i < statement.params.size(); ++i) {
        rc = BindParam(st, static_cast<int>(i + 1), statement.params[i]);
        if (rc != SQLITE_OK) return Translate(db, rc);
    }

    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        if (rows) rows->push_back(ReadRow(st));
    }
    return Translate(db, rc);
}

}
