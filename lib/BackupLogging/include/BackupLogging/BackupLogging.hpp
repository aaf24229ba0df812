#pragma once

#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

/**
 * @brief Logging settings for the command line tools.
 */
struct LoggingConfig
{
    std::optional<fs::path> logFile;    /**< Append-mode log file, console only when empty */
    bool verbose = false;               /**< Log at debug level instead of info */
};

/**
 * @brief Install the process-wide "vault-backup" spdlog logger.
 *
 * Logs go to stderr and, when configured, to the log file. A log file that
 * cannot be opened is reported and the logger falls back to stderr only.
 *
 * @param[in] config Logging settings
 */
void ConfigureLogging(const LoggingConfig& config);
