#include "SQLiteSession/SQLiteConnection.hpp"

#include "SQLiteSession/SQLiteError.hpp"

#include <sqlite3.h>

#include <utility>

namespace
{
constexpr const char* SqlDurabilityPragmas = "PRAGMA journal_mode=WAL;"
                                             "PRAGMA synchronous=FULL;";
}

SQLiteConnection::SQLiteConnection(const fs::path& databasePath, int busyTimeoutMs) : _database(nullptr), _name(databasePath.string())
{
    const int openFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int resultCode = sqlite3_open_v2(_name.c_str(), &_database, openFlags, nullptr);
    if (SQLITE_OK != resultCode)
    {
        const std::string detail = (nullptr != _database) ? sqlite3_errmsg(_database) : sqlite3_errstr(resultCode);
        Close();
        throw SQLiteError(resultCode, "Cannot open " + _name + ": " + detail);
    }

    try
    {
        sqlite3_busy_timeout(_database, busyTimeoutMs);
        ExecuteScript(SqlDurabilityPragmas);
    }
    catch (const SQLiteError&)
    {
        Close();
        throw;
    }
}

SQLiteConnection::~SQLiteConnection()
{
    Close();
}

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : _database(std::exchange(other._database, nullptr)), _name(std::move(other._name))
{
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept
{
    if (this != &other)
    {
        Close();
        _database = std::exchange(other._database, nullptr);
        _name = std::move(other._name);
    }
    return *this;
}

void SQLiteConnection::ExecuteScript(const std::string& sql)
{
    char* errorMessage = nullptr;
    const int resultCode = sqlite3_exec(_database, sql.c_str(), nullptr, nullptr, &errorMessage);
    if (SQLITE_OK != resultCode)
    {
        const std::string detail = (nullptr != errorMessage) ? errorMessage : sqlite3_errstr(resultCode);
        sqlite3_free(errorMessage);
        throw SQLiteError(resultCode, _name + ": " + detail);
    }
}

SQLiteStatement SQLiteConnection::Prepare(const std::string& sql)
{
    sqlite3_stmt* statement = nullptr;
    const int resultCode = sqlite3_prepare_v2(_database, sql.c_str(), static_cast<int>(sql.size()), &statement, nullptr);
    if (SQLITE_OK != resultCode)
    {
        throw SQLiteError(resultCode, _name + ": cannot prepare '" + sql + "': " + sqlite3_errmsg(_database));
    }
    return SQLiteStatement(statement, sql);
}

void SQLiteConnection::Close() noexcept
{
    if (nullptr != _database)
    {
        sqlite3_close_v2(_database);
        _database = nullptr;
    }
}
