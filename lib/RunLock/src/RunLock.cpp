#include "RunLock/RunLock.hpp"

#include <cerrno>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace
{
constexpr int InvalidDescriptor = -1;
constexpr mode_t LockFileMode = 0644;
}

RunLock::RunLock(const fs::path& lockFile) : _lockFile(lockFile), _descriptor(InvalidDescriptor)
{
}

RunLock::~RunLock()
{
    Release();
}

bool RunLock::TryAcquire()
{
    if (true == IsHeld())
    {
        return true;
    }

    const int descriptor = ::open(_lockFile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, LockFileMode);
    if (0 > descriptor)
    {
        throw std::system_error(errno, std::generic_category(), "cannot open lock file " + _lockFile.string());
    }

    // flock locks belong to the open file description, so a second descriptor
    // conflicts even inside the same process.
    if (0 != ::flock(descriptor, LOCK_EX | LOCK_NB))
    {
        const int lockError = errno;
        ::close(descriptor);
        if (EWOULDBLOCK == lockError)
        {
            return false;
        }
        throw std::system_error(lockError, std::generic_category(), "cannot lock " + _lockFile.string());
    }

    _descriptor = descriptor;
    return true;
}

void RunLock::Release()
{
    if (false == IsHeld())
    {
        return;
    }
    ::flock(_descriptor, LOCK_UN);
    ::close(_descriptor);
    _descriptor = InvalidDescriptor;
}

bool RunLock::IsHeld() const
{
    return InvalidDescriptor != _descriptor;
}
