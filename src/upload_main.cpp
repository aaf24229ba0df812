// file upload_main.cpp:

#include "ArchiveStore/LocalVaultArchiveStore.hpp"
#include "BackupLogging/BackupLogging.hpp"
#include "UploadCoordinator/UploadCoordinator.hpp"
#include "cxxopts.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace
{

fs::path DefaultVaultDirectory()
{
    const char* home = std::getenv("HOME");
    const fs::path base = (nullptr != home) ? fs::path(home) : fs::current_path();
    return base / ".config" / "vault_backup" / "vaults" / "default";
}

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @return Parsed options, or an empty optional when help was shown or the file is missing.
 */
std::optional<cxxopts::ParseResult> ParseCommandLineOptions(int argc, char* argv[])
{
    cxxopts::Options options("vault-upload", "Upload a single file to an archive vault");

    // clang-format off
    options.add_options()
        ("f,file",        "File to upload", cxxopts::value<std::string>())
        ("description",   "Archive description, defaults to the file name", cxxopts::value<std::string>())
        ("vault-dir",     "Vault directory", cxxopts::value<std::string>())
        ("concurrency",   "Parallel part uploads", cxxopts::value<unsigned int>()->default_value("5"))
        ("part-size-mib", "Part size in MiB, a power of two", cxxopts::value<unsigned int>()->default_value("4"))
        ("v,verbose",     "Verbose output")
        ("h,help",        "Print help");
    // clang-format on
    options.parse_positional({"file"});
    options.positional_help("FILE");

    auto parseResult = options.parse(argc, argv);

    if ((0 < parseResult.count("help")) || (0 == parseResult.count("file")))
    {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    return parseResult;
}

} // namespace

int main(int argc, char* argv[])
{
    std::optional<cxxopts::ParseResult> parseResult;
    try
    {
        parseResult = ParseCommandLineOptions(argc, argv);
    }
    catch (const std::exception& error)
    {
        std::cerr << error.what() << '\n';
        return 1;
    }

    if (false == parseResult.has_value())
    {
        return 1;
    }
    const cxxopts::ParseResult& options = parseResult.value();

    LoggingConfig logging;
    logging.verbose = (0 < options.count("verbose"));
    ConfigureLogging(logging);

    const fs::path file = options["file"].as<std::string>();
    const std::string description = (0 < options.count("description")) ? options["description"].as<std::string>() : file.filename().string();
    const fs::path vaultDirectory = (0 < options.count("vault-dir")) ? fs::path(options["vault-dir"].as<std::string>()) : DefaultVaultDirectory();

    UploadOptions uploadOptions;
    uploadOptions.concurrentUploads = options["concurrency"].as<unsigned int>();
    uploadOptions.partSize = static_cast<std::uint64_t>(options["part-size-mib"].as<unsigned int>()) * MinimumPartSize;

    try
    {
        LocalVaultArchiveStore archiveStore(vaultDirectory);
        UploadCoordinator coordinator(archiveStore, uploadOptions);

        std::string archiveId;
        const UploadStatus status = coordinator.Upload(file, description, archiveId);
        if (UploadStatus::Completed != status)
        {
            std::cerr << "upload failed: " << UploadStatusToString(status) << '\n';
            return 1;
        }
        std::cout << archiveId << '\n';
        return 0;
    }
    catch (const ArchiveStoreError& error)
    {
        spdlog::error("cannot open vault: {}", error.what());
        return 1;
    }
    catch (const std::invalid_argument& error)
    {
        spdlog::error("{}", error.what());
        return 1;
    }
}
