#include "BackupRunner/BackupRunner.hpp"

#include "CandidateScanner/CandidateScanner.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

const char* RunOutcomeToString(RunOutcome outcome)
{
    switch (outcome)
    {
    case RunOutcome::Finished:
        return "Finished";
    case RunOutcome::OngoingUpload:
        return "OngoingUpload";
    case RunOutcome::LedgerFailed:
        return "LedgerFailed";
    }
    return "Unknown";
}

BackupRunner::BackupRunner(RunLock& runLock, UploadLedger& ledger, UploadCoordinator& coordinator, const TarDirectoryStager& stager,
                           const TimestampProvider& timestampProvider, const RunOptions& options)
    : _runLock(runLock), _ledger(ledger), _coordinator(coordinator), _stager(stager), _timestampProvider(timestampProvider),
      _options(options)
{
}

RunSummary BackupRunner::Run(const std::vector<BackupTarget>& targets)
{
    RunSummary summary;
    if (false == _runLock.TryAcquire())
    {
        spdlog::warn("backup already in progress");
        summary.outcome = RunOutcome::OngoingUpload;
        return summary;
    }
    RunLockRelease lockRelease(_runLock);

    CandidateScanner scanner(_ledger);
    try
    {
        scanner.ForEachCandidate(targets,
                                 [&](const Candidate& candidate)
                                 {
                                     switch (BackupCandidate(candidate))
                                     {
                                     case CandidateOutcome::Uploaded:
                                         ++summary.uploaded;
                                         return false == _options.stopAfterFirstUpload;
                                     case CandidateOutcome::DryRun:
                                         ++summary.dryRun;
                                         return true;
                                     case CandidateOutcome::StagingFailed:
                                         ++summary.failed;
                                         return true;
                                     case CandidateOutcome::UploadFailed:
                                         ++summary.failed;
                                         return false == _options.stopAfterFirstUpload;
                                     case CandidateOutcome::LedgerWriteFailed:
                                         summary.outcome = RunOutcome::LedgerFailed;
                                         return false;
                                     }
                                     return true;
                                 });
    }
    catch (const LedgerError& error)
    {
        spdlog::critical("cannot read upload ledger: {}", error.what());
        summary.outcome = RunOutcome::LedgerFailed;
    }

    spdlog::info("run {}: {} uploaded, {} failed", RunOutcomeToString(summary.outcome), summary.uploaded, summary.failed);
    return summary;
}

CandidateOutcome BackupRunner::BackupCandidate(const Candidate& candidate)
{
    spdlog::debug("backup({})", candidate.path.string());

    if (true == _options.dryRun)
    {
        spdlog::info("dry run: would have uploaded {}", candidate.path.string());
        return CandidateOutcome::DryRun;
    }

    if (false == candidate.isDirectory)
    {
        return UploadAndRecord(candidate.path, candidate.path, candidate.path.filename().string());
    }

    fs::path archivePath;
    if (false == _stager.Stage(candidate.path, archivePath))
    {
        spdlog::error("failed to stage {}", candidate.path.string());
        return CandidateOutcome::StagingFailed;
    }

    StagedArchiveCleanup cleanup(_stager, archivePath);
    return UploadAndRecord(candidate.path, archivePath, archivePath.filename().string());
}

/**
 * @brief Upload a file and append the ledger row once the store has completed it.
 */
CandidateOutcome BackupRunner::UploadAndRecord(const fs::path& ledgerPath, const fs::path& uploadPath, const std::string& uploadedName)
{
    std::string archiveId;
    UploadStatus status = UploadStatus::SystemFault;
    try
    {
        status = _coordinator.Upload(uploadPath, uploadedName, archiveId);
    }
    catch (const std::system_error& error)
    {
        spdlog::error("upload of {} interrupted: {}", ledgerPath.string(), error.what());
        return CandidateOutcome::UploadFailed;
    }
    if (UploadStatus::Completed != status)
    {
        spdlog::error("upload of {} failed: {}", ledgerPath.string(), UploadStatusToString(status));
        return CandidateOutcome::UploadFailed;
    }

    try
    {
        _ledger.Record(ledgerPath.string(), uploadedName, archiveId, _timestampProvider.NowEpochSeconds());
    }
    catch (const LedgerError& error)
    {
        spdlog::critical("archive {} for {} is stored but could not be recorded: {}", archiveId, ledgerPath.string(), error.what());
        return CandidateOutcome::LedgerWriteFailed;
    }

    spdlog::info("uploaded {} as {} ({})", ledgerPath.string(), uploadedName, archiveId);
    return CandidateOutcome::Uploaded;
}
