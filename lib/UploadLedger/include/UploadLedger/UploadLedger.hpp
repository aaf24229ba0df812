#pragma once

#include "SQLiteSession/SQLiteSession.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Raised when the ledger cannot be read from or written to.
 */
class LedgerError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One completed upload as stored in the ledger.
 */
struct LedgerRecord
{
    std::string path;                       /**< Local path that was backed up */
    std::string uploadedName;               /**< Name the object was uploaded as */
    std::string archiveId;                  /**< Identifier returned by the archive store */
    std::int64_t uploadedAtEpochSeconds;    /**< Upload completion time */
};

/**
 * @brief Append-only record of completed uploads, persisted in SQLite.
 *
 * Rows are never updated or deleted. The last upload of a path is the row
 * with the greatest timestamp, regardless of insertion order.
 */
class UploadLedger
{
  public:
    /**
     * @brief Create a ledger bound to a SQLite session.
     *
     * @param[in] databaseSession Active SQLite session for persistence
     */
    explicit UploadLedger(SQLiteSession& databaseSession);

    /**
     * @brief Create the uploads table and its lookup index if missing.
     *
     * @throws LedgerError if the schema cannot be created
     */
    void InitializeSchema();

    /**
     * @brief Latest upload time recorded for a path.
     *
     * @param[in] path Local path as recorded
     * @return Greatest recorded epoch seconds, or empty when the path was never uploaded
     * @throws LedgerError on storage failure
     */
    std::optional<std::int64_t> GetLastUploaded(const std::string& path);

    /**
     * @brief Append an upload record. Returns once the row is committed.
     *
     * @param[in] path Local path that was backed up
     * @param[in] uploadedName Name the object was uploaded as
     * @param[in] archiveId Archive identifier returned by the store
     * @param[in] whenEpochSeconds Upload completion time
     * @throws LedgerError on storage failure
     */
    void Record(const std::string& path, const std::string& uploadedName, const std::string& archiveId, std::int64_t whenEpochSeconds);

    /**
     * @brief All records for a path, oldest first by timestamp.
     *
     * @param[in] path Local path as recorded
     * @return Matching records
     * @throws LedgerError on storage failure
     */
    std::vector<LedgerRecord> GetHistory(const std::string& path);

  private:
    SQLiteSession& _databaseSession;
};
