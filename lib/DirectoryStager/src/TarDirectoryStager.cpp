#include "DirectoryStager/TarDirectoryStager.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
constexpr const char* StageDirectoryTemplate = "stage-XXXXXX";
constexpr int ExecFailedExitCode = 127;

/**
 * @brief Run a command and wait for it.
 *
 * @return Exit status of the command, or -1 if it could not be started or was killed
 */
int RunCommand(const std::vector<std::string>& arguments)
{
    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (const auto& argument : arguments)
    {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (0 > pid)
    {
        return -1;
    }
    if (0 == pid)
    {
        ::execvp(argv[0], argv.data());
        ::_exit(ExecFailedExitCode);
    }

    int status = 0;
    while (0 > ::waitpid(pid, &status, 0))
    {
        if (EINTR != errno)
        {
            return -1;
        }
    }
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    return -1;
}
}

TarDirectoryStager::TarDirectoryStager(const fs::path& stagingRoot) : _stagingRoot(stagingRoot)
{
}

std::string TarDirectoryStager::ArchiveNameFor(const fs::path& directory)
{
    fs::path name = directory.filename();
    if (true == name.empty())
    {
        name = directory.parent_path().filename();
    }

    std::string archiveName = name.string();
    for (char& character : archiveName)
    {
        if (' ' == character)
        {
            character = '_';
        }
    }
    return archiveName + ".tar";
}

bool TarDirectoryStager::Stage(const fs::path& directory, fs::path& outputArchivePath) const
{
    fs::path stageDirectory;
    if (false == MakePrivateDirectory(stageDirectory))
    {
        return false;
    }

    const fs::path source = (true == directory.filename().empty()) ? directory.parent_path() : directory;
    const fs::path archivePath = stageDirectory / ArchiveNameFor(directory);
    const fs::path parent = (true == source.has_parent_path()) ? source.parent_path() : fs::path(".");

    spdlog::debug("tar cf {} {}", archivePath.string(), source.string());
    const int exitCode = RunCommand({"tar", "-cf", archivePath.string(), "-C", parent.string(), source.filename().string()});
    if (0 != exitCode)
    {
        spdlog::error("failed to tar {}: tar exited with {}", source.string(), exitCode);
        Cleanup(archivePath);
        return false;
    }

    outputArchivePath = archivePath;
    return true;
}

void TarDirectoryStager::Cleanup(const fs::path& archivePath) const
{
    std::error_code errorCode;
    fs::remove_all(archivePath.parent_path(), errorCode);
    if (0 != errorCode.value())
    {
        spdlog::warn("failed to remove staging directory {}: {}", archivePath.parent_path().string(), errorCode.message());
    }
}

/**
 * @brief Create a mode 0700 directory below the staging root.
 */
bool TarDirectoryStager::MakePrivateDirectory(fs::path& outputDirectory) const
{
    std::error_code errorCode;
    fs::create_directories(_stagingRoot, errorCode);
    if (0 != errorCode.value())
    {
        spdlog::error("cannot create staging root {}: {}", _stagingRoot.string(), errorCode.message());
        return false;
    }

    std::string pathTemplate = (_stagingRoot / StageDirectoryTemplate).string();
    if (nullptr == ::mkdtemp(pathTemplate.data()))
    {
        spdlog::error("cannot create staging directory in {}: {}", _stagingRoot.string(), std::strerror(errno));
        return false;
    }

    outputDirectory = pathTemplate;
    return true;
}
