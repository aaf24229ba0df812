#pragma once

#include "SQLiteSession/SQLiteStatement.hpp"

#include <filesystem>
#include <string>

struct sqlite3;

namespace fs = std::filesystem;

/**
 * @brief Owns one SQLite database handle.
 *
 * The handle is opened read-write, creating the file if needed, in write-ahead
 * logging mode with synchronous=FULL: a committed write survives a crash.
 */
class SQLiteConnection
{
  public:
    /**
     * @brief Open a database file.
     *
     * @param[in] databasePath Database file, created when missing
     * @param[in] busyTimeoutMs How long to wait on a lock held by another connection
     * @throws SQLiteError if the file cannot be opened or configured
     */
    SQLiteConnection(const fs::path& databasePath, int busyTimeoutMs);
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    /**
     * @brief Run one or more ';'-separated statements, discarding any rows.
     */
    void ExecuteScript(const std::string& sql);

    SQLiteStatement Prepare(const std::string& sql);

  private:
    void Close() noexcept;

    sqlite3* _database;
    std::string _name;
};
