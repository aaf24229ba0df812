#pragma once

#include "CandidateScanner/BackupTarget.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Parse a configuration boolean.
 *
 * Accepts true/false, yes/no, on/off and 1/0, case-insensitive.
 *
 * @param[in] text Value as written in the file
 * @param[out] outputValue Parsed value
 * @return false if the text is not a recognized boolean
 */
bool ParseConfigBoolean(const std::string& text, bool& outputValue);

/**
 * @brief Read backup targets from an INI stream.
 *
 * Every section names a target path; trailing slashes are removed. Keys
 * upload_files, upload_dirs, upload_single_dir and upload_if_changed default to
 * false, exclude_prefix is optional.
 *
 * @param[in] input INI text
 * @param[in] sourceName Name used in error messages
 * @return Targets in file order, or empty if the file is malformed
 */
std::optional<std::vector<BackupTarget>> ParseBackupTargets(std::istream& input, const std::string& sourceName);

/**
 * @brief Read backup targets from an INI file.
 *
 * @param[in] configFile Path of the configuration file
 * @return Targets in file order, or empty if the file is missing or malformed
 */
std::optional<std::vector<BackupTarget>> LoadBackupTargets(const fs::path& configFile);

/**
 * @brief Target for a path named on the command line, uploaded as a whole.
 */
BackupTarget SingleUploadTarget(const fs::path& path);

/**
 * @brief Remove trailing directory separators, keeping a lone root.
 */
fs::path StripTrailingSeparators(const std::string& path);
