#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Selection policy for one configured backup path.
 */
struct TargetPolicy
{
    bool uploadFiles = false;                    /**< Upload regular files directly inside the directory */
    bool uploadDirs = false;                     /**< Upload sub-directories, each as one tar object */
    bool uploadSingleDir = false;                /**< Upload the directory itself as one tar object */
    bool uploadIfChanged = false;                /**< Re-upload entries modified since their last upload */
    std::optional<std::string> excludePrefix;    /**< Skip entries whose name starts with this prefix */
};

/**
 * @brief A configured backup path together with its policy.
 */
struct BackupTarget
{
    fs::path path;
    TargetPolicy policy;
};

/**
 * @brief A path selected for upload during the current run.
 */
struct Candidate
{
    fs::path path;
    bool isDirectory;
};
