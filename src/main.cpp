// file main.cpp:

#include "ArchiveStore/LocalVaultArchiveStore.hpp"
#include "BackupConfig/BackupConfig.hpp"
#include "BackupLogging/BackupLogging.hpp"
#include "BackupRunner/BackupRunner.hpp"
#include "SQLiteSession/SQLiteSession.hpp"
#include "UploadLedger/UploadLedger.hpp"
#include "cxxopts.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace
{

constexpr int ExitSuccess = 0;
constexpr int ExitInvalidInvocation = 1;
constexpr int ExitLedgerFailed = 2;
constexpr int ExitCandidateFailed = 3;

/**
 * @brief Settings for one invocation of vault-backup.
 */
struct AppSettings
{
    std::vector<BackupTarget> targets;
    fs::path vaultDirectory;
    fs::path databaseFile;
    fs::path lockFile;
    fs::path stagingRoot;
    UploadOptions uploadOptions;
    RunOptions runOptions;
    LoggingConfig logging;
    std::optional<std::string> historyPath;
};

fs::path DefaultConfigDirectory()
{
    const char* home = std::getenv("HOME");
    const fs::path base = (nullptr != home) ? fs::path(home) : fs::current_path();
    return base / ".config" / "vault_backup";
}

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @return std::optional<cxxopts::ParseResult> if parsing is successful and help is not requested,
 *         otherwise returns an empty optional.
 */
std::optional<cxxopts::ParseResult> ParseCommandLineOptions(int argc, char* argv[])
{
    cxxopts::Options options("vault-backup", "Back up files and directories to an archive vault");

    // clang-format off
    options.add_options()
        ("c,config",      "File of backup paths", cxxopts::value<std::string>())
        ("p,path",        "Path of a file or directory to upload as a whole, overrides the config", cxxopts::value<std::vector<std::string>>())
        ("d,dryrun",      "Only show what would be backed up")
        ("a,all",         "Upload every candidate instead of stopping after the first upload")
        ("vault",         "Vault name", cxxopts::value<std::string>()->default_value("default"))
        ("vault-dir",     "Vault directory", cxxopts::value<std::string>())
        ("database",      "Upload ledger database", cxxopts::value<std::string>())
        ("lock-file",     "Run lock file", cxxopts::value<std::string>())
        ("log-file",      "Log file", cxxopts::value<std::string>())
        ("staging-dir",   "Directory for staged tar files", cxxopts::value<std::string>())
        ("concurrency",   "Parallel part uploads", cxxopts::value<unsigned int>()->default_value("5"))
        ("part-size-mib", "Part size in MiB, a power of two", cxxopts::value<unsigned int>()->default_value("4"))
        ("history",       "Print the upload history of a path and exit", cxxopts::value<std::string>())
        ("v,verbose",     "Verbose output")
        ("h,help",        "Print help");
    // clang-format on

    auto parseResult = options.parse(argc, argv);

    if (0 < parseResult.count("help"))
    {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    return parseResult;
}

/**
 * @brief Builds the invocation settings from parsed options and the configuration file.
 *
 * @param[in] parseResult The parsed command-line options.
 * @return std::optional<AppSettings> if configuration is successful, otherwise an empty optional.
 */
std::optional<AppSettings> SetupBackupConfiguration(const cxxopts::ParseResult& parseResult)
{
    AppSettings settings;
    const fs::path configDirectory = DefaultConfigDirectory();
    const std::string vault = parseResult["vault"].as<std::string>();

    auto pathOption = [&](const char* name, const fs::path& fallback)
    { return (0 < parseResult.count(name)) ? fs::path(parseResult[name].as<std::string>()) : fallback; };

    settings.vaultDirectory = pathOption("vault-dir", configDirectory / "vaults" / vault);
    settings.databaseFile = pathOption("database", configDirectory / ("ledger." + vault + ".sqlite3"));
    settings.lockFile = pathOption("lock-file", configDirectory / "vault_backup.lock");
    settings.stagingRoot = pathOption("staging-dir", fs::temp_directory_path() / "vault_backup");
    settings.logging.logFile = pathOption("log-file", configDirectory / "vault_backup.log");
    settings.logging.verbose = (0 < parseResult.count("verbose"));

    settings.runOptions.dryRun = (0 < parseResult.count("dryrun"));
    settings.runOptions.stopAfterFirstUpload = (0 == parseResult.count("all"));

    settings.uploadOptions.concurrentUploads = parseResult["concurrency"].as<unsigned int>();
    settings.uploadOptions.partSize = static_cast<std::uint64_t>(parseResult["part-size-mib"].as<unsigned int>()) * MinimumPartSize;

    ConfigureLogging(settings.logging);

    if (0 == settings.uploadOptions.concurrentUploads)
    {
        spdlog::error("--concurrency must be at least 1");
        return std::nullopt;
    }
    if (false == IsValidPartSize(settings.uploadOptions.partSize))
    {
        spdlog::error("--part-size-mib must be a power of two between 1 and 4096");
        return std::nullopt;
    }

    if (0 < parseResult.count("history"))
    {
        settings.historyPath = StripTrailingSeparators(parseResult["history"].as<std::string>()).string();
        return settings;
    }

    if (0 < parseResult.count("path"))
    {
        for (const auto& path : parseResult["path"].as<std::vector<std::string>>())
        {
            settings.targets.push_back(SingleUploadTarget(path));
        }
        return settings;
    }

    const fs::path configFile = pathOption("config", configDirectory / "vault_backup.conf");
    std::optional<std::vector<BackupTarget>> targets = LoadBackupTargets(configFile);
    if (false == targets.has_value())
    {
        return std::nullopt;
    }
    settings.targets = std::move(targets.value());
    return settings;
}

int PrintHistory(UploadLedger& ledger, const std::string& path)
{
    for (const auto& record : ledger.GetHistory(path))
    {
        std::cout << record.uploadedAtEpochSeconds << '\t' << record.uploadedName << '\t' << record.archiveId << '\n';
    }
    return ExitSuccess;
}

int RunWithSettings(const AppSettings& settings)
{
    std::error_code errorCode;
    fs::create_directories(settings.databaseFile.parent_path(), errorCode);
    fs::create_directories(settings.lockFile.parent_path(), errorCode);

    SQLiteSession database(settings.databaseFile);
    UploadLedger ledger(database);
    ledger.InitializeSchema();

    if (true == settings.historyPath.has_value())
    {
        return PrintHistory(ledger, settings.historyPath.value());
    }

    LocalVaultArchiveStore archiveStore(settings.vaultDirectory);
    UploadCoordinator coordinator(archiveStore, settings.uploadOptions);
    TarDirectoryStager stager(settings.stagingRoot);
    TimestampProvider timestampProvider;
    RunLock runLock(settings.lockFile);

    BackupRunner runner(runLock, ledger, coordinator, stager, timestampProvider, settings.runOptions);
    const RunSummary summary = runner.Run(settings.targets);

    switch (summary.outcome)
    {
    case RunOutcome::OngoingUpload:
        std::cerr << "backup already in progress, exiting\n";
        return ExitInvalidInvocation;
    case RunOutcome::LedgerFailed:
        return ExitLedgerFailed;
    case RunOutcome::Finished:
        break;
    }
    return (0 == summary.failed) ? ExitSuccess : ExitCandidateFailed;
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
        return ExitInvalidInvocation;
    }

    if (false == parseResult.has_value())
    {
        return ExitSuccess; // Help was shown.
    }

    std::optional<AppSettings> settings = SetupBackupConfiguration(parseResult.value());
    if (false == settings.has_value())
    {
        return ExitInvalidInvocation; // Configuration failed, error already logged.
    }

    try
    {
        return RunWithSettings(settings.value());
    }
    catch (const LedgerError& error)
    {
        spdlog::critical("{}", error.what());
        return ExitLedgerFailed;
    }
    catch (const ArchiveStoreError& error)
    {
        spdlog::error("cannot open vault: {}", error.what());
        return ExitInvalidInvocation;
    }
    catch (const std::system_error& error)
    {
        spdlog::error("{}", error.what());
        return ExitInvalidInvocation;
    }
}
