#include "CandidateScanner/CandidateScanner.hpp"

#include <algorithm>
#include <cstdint>

#include <spdlog/spdlog.h>
#include <sys/stat.h>

namespace
{
/**
 * @brief Read the modification time of a path at full filesystem resolution.
 */
bool ModifiedTime(const fs::path& path, struct timespec& outputTime)
{
    struct stat status{};
    if (0 != ::stat(path.c_str(), &status))
    {
        return false;
    }
    outputTime = status.st_mtim;
    return true;
}

/**
 * @brief Whether a modification time lies strictly after whole epoch seconds.
 */
bool IsLaterThan(const struct timespec& modified, std::int64_t epochSeconds)
{
    const auto seconds = static_cast<std::int64_t>(modified.tv_sec);
    return (seconds > epochSeconds) || ((seconds == epochSeconds) && (0 < modified.tv_nsec));
}

bool HasPrefix(const std::string& name, const std::optional<std::string>& prefix)
{
    return (true == prefix.has_value()) && (false == prefix->empty()) && (0 == name.compare(0, prefix->size(), *prefix));
}
}

CandidateScanner::CandidateScanner(UploadLedger& ledger) : _ledger(ledger)
{
}

bool CandidateScanner::ForEachCandidate(const std::vector<BackupTarget>& targets,
                                        const std::function<bool(const Candidate&)>& onCandidate)
{
    for (const auto& target : targets)
    {
        if (false == ScanTarget(target, onCandidate))
        {
            return false;
        }
    }
    return true;
}

bool CandidateScanner::NeedsUpload(const fs::path& entry, bool ifChanged)
{
    const std::optional<std::int64_t> lastUploaded = _ledger.GetLastUploaded(entry.string());
    if (false == lastUploaded.has_value())
    {
        return true;
    }
    if (false == ifChanged)
    {
        return false;
    }

    struct timespec modified{};
    if (false == ModifiedTime(entry, modified))
    {
        spdlog::warn("cannot read modification time of {}, treating as unchanged", entry.string());
        return false;
    }
    return IsLaterThan(modified, lastUploaded.value());
}

/**
 * @brief Deliver the candidates of a single target.
 *
 * @return false if the callback asked to stop
 */
bool CandidateScanner::ScanTarget(const BackupTarget& target, const std::function<bool(const Candidate&)>& onCandidate)
{
    std::error_code errorCode;
    const fs::file_status status = fs::status(target.path, errorCode);
    if ((0 != errorCode.value()) || (false == fs::exists(status)))
    {
        spdlog::debug("skipping nonexistent path {}", target.path.string());
        return true;
    }

    spdlog::info("starting on {}", target.path.string());

    if (true == fs::is_regular_file(status))
    {
        return onCandidate({target.path, false});
    }
    if (false == fs::is_directory(status))
    {
        spdlog::debug("skipping {}, neither a file nor a directory", target.path.string());
        return true;
    }

    const TargetPolicy& policy = target.policy;
    if (true == policy.uploadSingleDir)
    {
        return onCandidate({target.path, true});
    }
    if ((false == policy.uploadFiles) && (false == policy.uploadDirs))
    {
        return true;
    }

    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator iterator(target.path, errorCode), end; (0 == errorCode.value()) && (iterator != end);
         iterator.increment(errorCode))
    {
        entries.push_back(*iterator);
    }
    if (0 != errorCode.value())
    {
        spdlog::error("failed to list {}: {}", target.path.string(), errorCode.message());
        return true;
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& left, const fs::directory_entry& right) { return left.path().filename() < right.path().filename(); });

    for (const auto& entry : entries)
    {
        if (true == HasPrefix(entry.path().filename().string(), policy.excludePrefix))
        {
            continue;
        }

        std::error_code entryError;
        const bool isDirectory = entry.is_directory(entryError);
        const bool isFile = (false == isDirectory) && entry.is_regular_file(entryError);
        const bool selected = ((true == isDirectory) && (true == policy.uploadDirs)) || ((true == isFile) && (true == policy.uploadFiles));
        if (false == selected)
        {
            continue;
        }

        if ((true == NeedsUpload(entry.path(), policy.uploadIfChanged)) && (false == onCandidate({entry.path(), isDirectory})))
        {
            return false;
        }
    }
    return true;
}
