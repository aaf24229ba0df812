#include "SQLiteSession/SQLiteSession.hpp"

#include "SQLiteSession/SQLiteConnection.hpp"

SQLiteSession::SQLiteSession(const fs::path& databasePath, int busyTimeoutMs)
    : _databasePath(databasePath), _busyTimeoutMs(busyTimeoutMs)
{
}

SQLiteSession::~SQLiteSession() = default;

SQLiteConnection& SQLiteSession::Acquire()
{
    const std::thread::id threadId = std::this_thread::get_id();
    std::lock_guard lock(_connectionsMutex);

    auto iterator = _connections.find(threadId);
    if (_connections.end() != iterator)
    {
        return *iterator->second;
    }

    auto connection = std::make_unique<SQLiteConnection>(_databasePath, _busyTimeoutMs);
    return *_connections.emplace(threadId, std::move(connection)).first->second;
}

const fs::path& SQLiteSession::DatabasePath() const
{
    return _databasePath;
}

std::size_t SQLiteSession::OpenConnections() const
{
    std::lock_guard lock(_connectionsMutex);
    return _connections.size();
}
