#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct sqlite3_stmt;

/**
 * @brief Owns one prepared statement. Parameters are 1-based, columns 0-based.
 *
 * Every failure is thrown as SQLiteError naming the statement's SQL.
 */
class SQLiteStatement
{
  public:
    SQLiteStatement(sqlite3_stmt* statement, std::string sql);
    ~SQLiteStatement();

    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    SQLiteStatement(SQLiteStatement&& other) noexcept;
    SQLiteStatement& operator=(SQLiteStatement&& other) noexcept;

    void Bind(int parameter, const std::string& value);
    void Bind(int parameter, std::int64_t value);

    /**
     * @brief Advance to the next result row.
     *
     * @return true while a row is available
     */
    bool NextRow();

    /**
     * @brief Run a statement that must not produce rows, such as an INSERT.
     */
    void Run();

    std::string Text(int column) const;
    std::int64_t Int64(int column) const;
    /**
     * @brief Integer column that may be NULL, e.g. an aggregate over no rows.
     */
    std::optional<std::int64_t> OptionalInt64(int column) const;

  private:
    int Step();
    [[noreturn]] void Fail(int resultCode, const char* action) const;
    void Release() noexcept;

    sqlite3_stmt* _statement;
    std::string _sql;
};
