#pragma once

#include "CandidateScanner/BackupTarget.hpp"
#include "UploadLedger/UploadLedger.hpp"

#include <filesystem>
#include <functional>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Application component selecting upload candidates from backup targets.
 *
 * Targets are processed strictly one after the other: nothing is enumerated or
 * looked up for a target before the consumer has finished with the previous one.
 */
class CandidateScanner
{
  public:
    /**
     * @brief Construct a scanner consulting the given ledger.
     *
     * @param[in] ledger Ledger used to skip already uploaded entries
     */
    explicit CandidateScanner(UploadLedger& ledger);

    /**
     * @brief Deliver the candidates of each target in target order.
     *
     * Entries of a directory are delivered sorted by name.
     *
     * @param[in] targets Backup targets in configuration order
     * @param[in] onCandidate Callback receiving each candidate, returns false to stop scanning
     * @return true if every target was scanned, false if the callback stopped the scan
     * @throws LedgerError if the ledger cannot be read
     */
    bool ForEachCandidate(const std::vector<BackupTarget>& targets, const std::function<bool(const Candidate&)>& onCandidate);

    /**
     * @brief Decide whether an entry has to be uploaded.
     *
     * @param[in] entry Local path of the entry
     * @param[in] ifChanged Re-upload when modified after the last upload
     * @return true if the entry was never uploaded, or ifChanged is set and its
     *         modification time is strictly later than the last upload
     * @throws LedgerError if the ledger cannot be read
     */
    bool NeedsUpload(const fs::path& entry, bool ifChanged);

  private:
    bool ScanTarget(const BackupTarget& target, const std::function<bool(const Candidate&)>& onCandidate);

    UploadLedger& _ledger;
};
