#include "SQLiteSession/SQLiteStatement.hpp"

#include "SQLiteSession/SQLiteError.hpp"

#include <sqlite3.h>

#include <utility>

SQLiteStatement::SQLiteStatement(sqlite3_stmt* statement, std::string sql) : _statement(statement), _sql(std::move(sql))
{
    if (nullptr == _statement)
    {
        throw SQLiteError(SQLITE_MISUSE, "No prepared statement for: " + _sql);
    }
}

SQLiteStatement::~SQLiteStatement()
{
    Release();
}

SQLiteStatement::SQLiteStatement(SQLiteStatement&& other) noexcept
    : _statement(std::exchange(other._statement, nullptr)), _sql(std::move(other._sql))
{
}

SQLiteStatement& SQLiteStatement::operator=(SQLiteStatement&& other) noexcept
{
    if (this != &other)
    {
        Release();
        _statement = std::exchange(other._statement, nullptr);
        _sql = std::move(other._sql);
    }
    return *this;
}

void SQLiteStatement::Bind(int parameter, const std::string& value)
{
    const int resultCode = sqlite3_bind_text(_statement, parameter, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (SQLITE_OK != resultCode)
    {
        Fail(resultCode, "bind text");
    }
}

void SQLiteStatement::Bind(int parameter, std::int64_t value)
{
    const int resultCode = sqlite3_bind_int64(_statement, parameter, static_cast<sqlite3_int64>(value));
    if (SQLITE_OK != resultCode)
    {
        Fail(resultCode, "bind integer");
    }
}

bool SQLiteStatement::NextRow()
{
    return SQLITE_ROW == Step();
}

void SQLiteStatement::Run()
{
    if (SQLITE_ROW == Step())
    {
        throw SQLiteError(SQLITE_MISUSE, "Unexpected result row for: " + _sql);
    }
}

std::string SQLiteStatement::Text(int column) const
{
    const unsigned char* value = sqlite3_column_text(_statement, column);
    if (nullptr == value)
    {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(value), static_cast<std::size_t>(sqlite3_column_bytes(_statement, column)));
}

std::int64_t SQLiteStatement::Int64(int column) const
{
    return static_cast<std::int64_t>(sqlite3_column_int64(_statement, column));
}

std::optional<std::int64_t> SQLiteStatement::OptionalInt64(int column) const
{
    if (SQLITE_NULL == sqlite3_column_type(_statement, column))
    {
        return std::nullopt;
    }
    return Int64(column);
}

/**
 * @brief Step once, returning SQLITE_ROW or SQLITE_DONE.
 */
int SQLiteStatement::Step()
{
    const int resultCode = sqlite3_step(_statement);
    if ((SQLITE_ROW != resultCode) && (SQLITE_DONE != resultCode))
    {
        Fail(resultCode, "step");
    }
    return resultCode;
}

void SQLiteStatement::Fail(int resultCode, const char* action) const
{
    sqlite3* database = sqlite3_db_handle(_statement);
    const std::string detail = (nullptr != database) ? sqlite3_errmsg(database) : sqlite3_errstr(resultCode);
    throw SQLiteError(resultCode, std::string("SQLite ") + action + " failed (" + detail + ") for: " + _sql);
}

void SQLiteStatement::Release() noexcept
{
    if (nullptr != _statement)
    {
        sqlite3_finalize(_statement);
        _statement = nullptr;
    }
}
