#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Infrastructure component packing a directory into a single tar file with tar(1).
 */
class TarDirectoryStager
{
  public:
    /**
     * @brief Construct a stager writing below a staging root.
     *
     * @param[in] stagingRoot Parent of the private per-stage directories
     */
    explicit TarDirectoryStager(const fs::path& stagingRoot);

    /**
     * @brief Name a directory is uploaded under: its name with spaces as underscores, plus ".tar".
     */
    static std::string ArchiveNameFor(const fs::path& directory);

    /**
     * @brief Create the tar file for a directory in a fresh private directory.
     *
     * @param[in] directory Directory to pack
     * @param[out] outputArchivePath Created tar file
     * @return true on success, false if the staging directory or the tar file could not be created
     */
    bool Stage(const fs::path& directory, fs::path& outputArchivePath) const;

    /**
     * @brief Remove a staged tar file together with its private directory.
     *
     * @param[in] archivePath Path returned by Stage
     */
    void Cleanup(const fs::path& archivePath) const;

  private:
    bool MakePrivateDirectory(fs::path& outputDirectory) const;

    fs::path _stagingRoot;
};

/**
 * @brief Removes a staged tar file when leaving scope.
 */
class StagedArchiveCleanup
{
  public:
    StagedArchiveCleanup(const TarDirectoryStager& stager, const fs::path& archivePath) : _stager(stager), _archivePath(archivePath)
    {
    }
    ~StagedArchiveCleanup()
    {
        _stager.Cleanup(_archivePath);
    }

    StagedArchiveCleanup(const StagedArchiveCleanup&) = delete;
    StagedArchiveCleanup& operator=(const StagedArchiveCleanup&) = delete;

  private:
    const TarDirectoryStager& _stager;
    fs::path _archivePath;
};
