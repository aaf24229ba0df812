#pragma once

#include <filesystem>

namespace fs = std::filesystem;

/**
 * @brief Cross-process exclusive run lock backed by an advisory lock file.
 *
 * A held lock is reported by TryAcquire returning false, never by waiting.
 * The lock is released by Release or when the object is destroyed.
 */
class RunLock
{
  public:
    /**
     * @brief Bind the lock to a lock file. Nothing is opened until TryAcquire.
     *
     * @param[in] lockFile Path of the lock file, created when missing
     */
    explicit RunLock(const fs::path& lockFile);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    /**
     * @brief Try to take the lock without blocking.
     *
     * @return true if the lock is now held by this object, false if another holder has it
     * @throws std::system_error if the lock file cannot be opened or locked for another reason
     */
    bool TryAcquire();

    /**
     * @brief Release the lock if held.
     */
    void Release();

    bool IsHeld() const;

  private:
    fs::path _lockFile;
    int _descriptor;
};

/**
 * @brief Releases a held RunLock when leaving scope.
 */
class RunLockRelease
{
  public:
    explicit RunLockRelease(RunLock& runLock) : _runLock(runLock)
    {
    }
    ~RunLockRelease()
    {
        _runLock.Release();
    }

    RunLockRelease(const RunLockRelease&) = delete;
    RunLockRelease& operator=(const RunLockRelease&) = delete;

  private:
    RunLock& _runLock;
};
