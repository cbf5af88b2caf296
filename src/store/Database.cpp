// SPDX-License-Identifier: Apache-2.0
#include "Database.hpp"

#include <core/Log.hpp>

#include <sqlite3.h>

#include <format>
#include <utility>

namespace mcphub::store
{

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt): _db(db), _stmt(stmt)
{
}

Statement::Statement(Statement&& other) noexcept:
    _db(std::exchange(other._db, nullptr)), _stmt(std::exchange(other._stmt, nullptr))
{
}

Statement& Statement::operator=(Statement&& other) noexcept
{
    if (this != &other)
    {
        if (_stmt)
            sqlite3_finalize(_stmt);
        _db = std::exchange(other._db, nullptr);
        _stmt = std::exchange(other._stmt, nullptr);
    }
    return *this;
}

Statement::~Statement()
{
    if (_stmt)
        sqlite3_finalize(_stmt);
}

auto Statement::bind(int index, std::string_view value) -> VoidResult
{
    return check(sqlite3_bind_text(_stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
                 "bind text");
}

auto Statement::bind(int index, const std::string& value) -> VoidResult
{
    return bind(index, std::string_view(value));
}

auto Statement::bind(int index, int64_t value) -> VoidResult
{
    return check(sqlite3_bind_int64(_stmt, index, value), "bind integer");
}

auto Statement::bind(int index, const std::optional<std::string>& value) -> VoidResult
{
    if (!value)
        return bindNull(index);
    return bind(index, std::string_view(*value));
}

auto Statement::bindNull(int index) -> VoidResult
{
    return check(sqlite3_bind_null(_stmt, index), "bind null");
}

auto Statement::step() -> Result<bool>
{
    auto const rc = sqlite3_step(_stmt);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return makeError(ErrorCode::DatabaseError, std::format("SQLite step failed: {}", sqlite3_errmsg(_db)));
}

auto Statement::execute() -> VoidResult
{
    return step().and_then([](bool) -> VoidResult { return {}; });
}

auto Statement::columnText(int column) const -> std::string
{
    auto const* text = sqlite3_column_text(_stmt, column);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(_stmt, column)));
}

auto Statement::columnOptionalText(int column) const -> std::optional<std::string>
{
    if (sqlite3_column_type(_stmt, column) == SQLITE_NULL)
        return std::nullopt;
    return columnText(column);
}

auto Statement::columnInt(int column) const -> int64_t
{
    return sqlite3_column_int64(_stmt, column);
}

auto Statement::check(int rc, std::string_view what) const -> VoidResult
{
    if (rc != SQLITE_OK)
        return makeError(ErrorCode::DatabaseError, std::format("SQLite {} failed: {}", what, sqlite3_errmsg(_db)));
    return {};
}

Database::Database(OpenTag, sqlite3* db, std::string path): _db(db), _path(std::move(path))
{
}

Database::~Database()
{
    if (_db)
        sqlite3_close(_db);
}

auto Database::open(const std::string& path) -> Result<std::unique_ptr<Database>>
{
    sqlite3* db = nullptr;
    auto const flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK)
    {
        auto message = std::format("Cannot open database '{}': {}", path, db ? sqlite3_errmsg(db) : "out of memory");
        if (db)
            sqlite3_close(db);
        return makeError(ErrorCode::DatabaseError, std::move(message));
    }

    sqlite3_busy_timeout(db, 5000);

    auto database = std::make_unique<Database>(OpenTag {}, db, path);
    if (path != ":memory:")
    {
        if (auto wal = database->exec("PRAGMA journal_mode=WAL;"); !wal)
            log::warning("Could not enable WAL for '{}': {}", path, wal.error().message);
    }
    if (auto fk = database->exec("PRAGMA foreign_keys=ON;"); !fk)
        return std::unexpected(fk.error());

    log::debug("Opened database {}", path);
    return database;
}

auto Database::exec(std::string_view sql) -> VoidResult
{
    auto const text = std::string(sql);
    char* errorMessage = nullptr;
    if (sqlite3_exec(_db, text.c_str(), nullptr, nullptr, &errorMessage) != SQLITE_OK)
    {
        auto error = makeError(ErrorCode::DatabaseError,
                               std::format("SQLite exec failed: {}", errorMessage ? errorMessage : "unknown error"));
        sqlite3_free(errorMessage);
        return error;
    }
    return {};
}

auto Database::prepare(std::string_view sql) -> Result<Statement>
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(_db, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK)
        return makeError(ErrorCode::DatabaseError, std::format("SQLite prepare failed: {}", sqlite3_errmsg(_db)));
    return Statement(_db, stmt);
}

auto Database::changes() const -> int
{
    return sqlite3_changes(_db);
}

} // namespace mcphub::store
