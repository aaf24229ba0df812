#pragma once

#include "CandidateScanner/BackupTarget.hpp"
#include "DirectoryStager/TarDirectoryStager.hpp"
#include "RunLock/RunLock.hpp"
#include "TimestampProvider/TimestampProvider.hpp"
#include "UploadCoordinator/UploadCoordinator.hpp"
#include "UploadLedger/UploadLedger.hpp"

#include <cstddef>
#include <vector>

/**
 * @brief Overall result of a backup run.
 */
enum class RunOutcome
{
    Finished,       /**< Candidates were processed, individual uploads may have failed */
    OngoingUpload,  /**< Another run holds the run lock, nothing was attempted */
    LedgerFailed    /**< The ledger could not be read or written, the run was stopped */
};

const char* RunOutcomeToString(RunOutcome outcome);

/**
 * @brief Result of handling one candidate.
 */
enum class CandidateOutcome
{
    Uploaded,
    DryRun,
    StagingFailed,
    UploadFailed,
    LedgerWriteFailed
};

/**
 * @brief Run-wide behaviour switches.
 */
struct RunOptions
{
    bool stopAfterFirstUpload = true;   /**< End the run after the first attempted upload */
    bool dryRun = false;                /**< Only report what would be uploaded */
};

/**
 * @brief Counters and outcome of a run.
 */
struct RunSummary
{
    RunOutcome outcome = RunOutcome::Finished;
    std::size_t uploaded = 0;
    std::size_t failed = 0;
    std::size_t dryRun = 0;
};

/**
 * @brief Application component orchestrating a backup run.
 *
 * Holds the run lock for the whole run, uploads every selected candidate
 * (directories through a staged tar file) and records each completed upload
 * in the ledger. A failed candidate is logged and skipped; a ledger failure
 * stops the run.
 */
class BackupRunner
{
  public:
    /**
     * @brief Construct a runner from its collaborators.
     *
     * @param[in] runLock Process-wide run lock
     * @param[in] ledger Upload ledger
     * @param[in] coordinator Upload coordinator
     * @param[in] stager Directory stager
     * @param[in] timestampProvider Clock used for ledger timestamps
     * @param[in] options Run mode
     */
    BackupRunner(RunLock& runLock, UploadLedger& ledger, UploadCoordinator& coordinator, const TarDirectoryStager& stager,
                 const TimestampProvider& timestampProvider, const RunOptions& options);

    /**
     * @brief Back up the candidates of the given targets.
     *
     * @param[in] targets Backup targets in configuration order
     * @return Outcome and counters of the run
     */
    RunSummary Run(const std::vector<BackupTarget>& targets);

    /**
     * @brief Stage if needed, upload and record a single candidate.
     *
     * @param[in] candidate Candidate to back up
     * @return What happened to the candidate
     */
    CandidateOutcome BackupCandidate(const Candidate& candidate);

  private:
    CandidateOutcome UploadAndRecord(const fs::path& ledgerPath, const fs::path& uploadPath, const std::string& uploadedName);

    RunLock& _runLock;
    UploadLedger& _ledger;
    UploadCoordinator& _coordinator;
    const TarDirectoryStager& _stager;
    const TimestampProvider& _timestampProvider;
    RunOptions _options;
};
