#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

class SQLiteConnection;

namespace fs = std::filesystem;

/**
 * @brief Hands out one SQLite connection per calling thread for a database file.
 *
 * SQLite handles must not be shared between threads that run statements at the
 * same time, so each thread gets its own handle, opened lazily and kept until
 * the session is destroyed.
 */
class SQLiteSession
{
  public:
    static constexpr int DefaultBusyTimeoutMs = 5000;

    /**
     * @param[in] databasePath Database file shared by all connections
     * @param[in] busyTimeoutMs Lock wait applied to every connection
     */
    explicit SQLiteSession(const fs::path& databasePath, int busyTimeoutMs = DefaultBusyTimeoutMs);
    ~SQLiteSession();

    SQLiteSession(const SQLiteSession&) = delete;
    SQLiteSession& operator=(const SQLiteSession&) = delete;

    /**
     * @brief Connection of the calling thread.
     *
     * @throws SQLiteError if the connection has to be opened and cannot be
     */
    SQLiteConnection& Acquire();

    const fs::path& DatabasePath() const;

    std::size_t OpenConnections() const;

  private:
    fs::path _databasePath;
    int _busyTimeoutMs;
    mutable std::mutex _connectionsMutex;
    std::map<std::thread::id, std::unique_ptr<SQLiteConnection>> _connections;
};
