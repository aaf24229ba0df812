#include "UploadLedger/UploadLedger.hpp"

#include "SQLiteSession/SQLiteConnection.hpp"
#include "SQLiteSession/SQLiteError.hpp"

#include <spdlog/spdlog.h>

namespace
{
constexpr const char* SqlCreateUploadsTable = "CREATE TABLE IF NOT EXISTS uploads ("
                                              "path TEXT,"
                                              "name TEXT,"
                                              "archive_id TEXT,"
                                              "uploaded_date INTEGER);"
                                              "CREATE INDEX IF NOT EXISTS uploads_path_date "
                                              "ON uploads(path, uploaded_date);";

constexpr const char* SqlSelectLastUploaded = "SELECT MAX(uploaded_date) FROM uploads WHERE path=?1;";

constexpr const char* SqlInsertUpload = "INSERT INTO uploads(path, name, archive_id, uploaded_date) "
                                        "VALUES(?1, ?2, ?3, ?4);";

constexpr const char* SqlSelectHistory = "SELECT path, name, archive_id, uploaded_date FROM uploads "
                                         "WHERE path=?1 ORDER BY uploaded_date ASC, rowid ASC;";
}

UploadLedger::UploadLedger(SQLiteSession& databaseSession) : _databaseSession(databaseSession)
{
}

void UploadLedger::InitializeSchema()
{
    try
    {
        _databaseSession.Acquire().ExecuteScript(SqlCreateUploadsTable);
    }
    catch (const SQLiteError& error)
    {
        throw LedgerError("Failed to initialize ledger " + _databaseSession.DatabasePath().string() + ": " + error.what());
    }
}

std::optional<std::int64_t> UploadLedger::GetLastUploaded(const std::string& path)
{
    try
    {
        auto statement = _databaseSession.Acquire().Prepare(SqlSelectLastUploaded);
        statement.Bind(1, path);

        if (false == statement.NextRow())
        {
            return std::nullopt;
        }
        return statement.OptionalInt64(0);
    }
    catch (const SQLiteError& error)
    {
        throw LedgerError("Failed to read ledger for " + path + ": " + error.what());
    }
}

void UploadLedger::Record(const std::string& path, const std::string& uploadedName, const std::string& archiveId,
                          std::int64_t whenEpochSeconds)
{
    spdlog::debug("INSERT INTO uploads VALUES ({}, {}, {}, {})", path, uploadedName, archiveId, whenEpochSeconds);
    try
    {
        auto statement = _databaseSession.Acquire().Prepare(SqlInsertUpload);
        statement.Bind(1, path);
        statement.Bind(2, uploadedName);
        statement.Bind(3, archiveId);
        statement.Bind(4, whenEpochSeconds);

        statement.Run();
    }
    catch (const SQLiteError& error)
    {
        throw LedgerError("Failed to record upload of " + path + ": " + error.what());
    }
}

std::vector<LedgerRecord> UploadLedger::GetHistory(const std::string& path)
{
    try
    {
        auto statement = _databaseSession.Acquire().Prepare(SqlSelectHistory);
        statement.Bind(1, path);

        std::vector<LedgerRecord> records;
        while (true == statement.NextRow())
        {
            records.push_back({statement.Text(0), statement.Text(1), statement.Text(2), statement.Int64(3)});
        }
        return records;
    }
    catch (const SQLiteError& error)
    {
        throw LedgerError("Failed to read ledger history for " + path + ": " + error.what());
    }
}
