// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace mcphub::store
{

class Database;

/// @brief A prepared SQLite statement. Finalized on destruction.
///
/// Parameter indices are 1-based, column indices 0-based (as in SQLite).
class Statement
{
  public:
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto bind(int index, std::string_view value) -> VoidResult;
    [[nodiscard]] auto bind(int index, const std::string& value) -> VoidResult;
    [[nodiscard]] auto bind(int index, int64_t value) -> VoidResult;
    [[nodiscard]] auto bind(int index, const std::optional<std::string>& value) -> VoidResult;
    [[nodiscard]] auto bindNull(int index) -> VoidResult;

    /// @brief Advances to the next row.
    /// @return true if a row is available, false when done, or a DatabaseError.
    [[nodiscard]] auto step() -> Result<bool>;

    /// @brief Runs a statement that returns no rows.
    [[nodiscard]] auto execute() -> VoidResult;

    [[nodiscard]] auto columnText(int column) const -> std::string;
    [[nodiscard]] auto columnOptionalText(int column) const -> std::optional<std::string>;
    [[nodiscard]] auto columnInt(int column) const -> int64_t;

  private:
    friend class Database;
    Statement(sqlite3* db, sqlite3_stmt* stmt);

    [[nodiscard]] auto check(int rc, std::string_view what) const -> VoidResult;

    sqlite3* _db = nullptr;
    sqlite3_stmt* _stmt = nullptr;
};

/// @brief RAII wrapper around a SQLite connection.
///
/// The connection is opened in serialized threading mode; callers that need a
/// multi-statement sequence to be atomic take lock().
class Database
{
    struct OpenTag
    {
        explicit OpenTag() = default;
    };

  public:
    /// @brief Adopts an open connection; only reachable through open().
    Database(OpenTag, sqlite3* db, std::string path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// @brief Opens (creating if needed) the database at @p path; ":memory:" opens a private in-memory database.
    [[nodiscard]] static auto open(const std::string& path) -> Result<std::unique_ptr<Database>>;

    /// @brief Executes one or more SQL statements without parameters.
    [[nodiscard]] auto exec(std::string_view sql) -> VoidResult;

    /// @brief Prepares a statement.
    [[nodiscard]] auto prepare(std::string_view sql) -> Result<Statement>;

    /// @brief Returns the number of rows modified by the most recent statement.
    [[nodiscard]] auto changes() const -> int;

    /// @brief Returns the mutex serializing multi-statement sequences.
    [[nodiscard]] auto lock() -> std::unique_lock<std::recursive_mutex> { return std::unique_lock(_mutex); }

    [[nodiscard]] auto path() const -> const std::string& { return _path; }

  private:
    sqlite3* _db = nullptr;
    std::string _path;
    std::recursive_mutex _mutex;
};

} // namespace mcphub::store
