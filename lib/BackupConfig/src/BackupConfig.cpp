#include "BackupConfig/BackupConfig.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spdlog/spdlog.h>

namespace pt = boost::property_tree;

namespace
{
constexpr const char* KeyUploadFiles = "upload_files";
constexpr const char* KeyUploadDirs = "upload_dirs";
constexpr const char* KeyUploadSingleDir = "upload_single_dir";
constexpr const char* KeyUploadIfChanged = "upload_if_changed";
constexpr const char* KeyExcludePrefix = "exclude_prefix";

/**
 * @brief Read an optional boolean key of a section.
 */
bool ReadFlag(const pt::ptree& section, const std::string& sectionName, const char* key, bool& outputValue)
{
    const auto value = section.get_optional<std::string>(pt::ptree::path_type(key, '\0'));
    if (false == value.has_value())
    {
        outputValue = false;
        return true;
    }
    if (false == ParseConfigBoolean(*value, outputValue))
    {
        spdlog::error("[{}] {}: '{}' is not a boolean", sectionName, key, *value);
        return false;
    }
    return true;
}
}

bool ParseConfigBoolean(const std::string& text, bool& outputValue)
{
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char character) { return std::tolower(character); });

    if (("true" == lowered) || ("yes" == lowered) || ("on" == lowered) || ("1" == lowered))
    {
        outputValue = true;
        return true;
    }
    if (("false" == lowered) || ("no" == lowered) || ("off" == lowered) || ("0" == lowered))
    {
        outputValue = false;
        return true;
    }
    return false;
}

fs::path StripTrailingSeparators(const std::string& path)
{
    std::string trimmed = path;
    while ((1 < trimmed.size()) && ('/' == trimmed.back()))
    {
        trimmed.pop_back();
    }
    return fs::path(trimmed);
}

std::optional<std::vector<BackupTarget>> ParseBackupTargets(std::istream& input, const std::string& sourceName)
{
    pt::ptree tree;
    try
    {
        pt::ini_parser::read_ini(input, tree);
    }
    catch (const pt::ini_parser_error& error)
    {
        spdlog::error("cannot parse {}: {}", sourceName, error.message());
        return std::nullopt;
    }

    std::vector<BackupTarget> targets;
    for (const auto& [sectionName, section] : tree)
    {
        if ((true == section.empty()) && (false == section.data().empty()))
        {
            spdlog::error("{}: '{}' is not inside a [path] section", sourceName, sectionName);
            return std::nullopt;
        }

        BackupTarget target;
        target.path = StripTrailingSeparators(sectionName);

        TargetPolicy& policy = target.policy;
        if ((false == ReadFlag(section, sectionName, KeyUploadFiles, policy.uploadFiles))
            || (false == ReadFlag(section, sectionName, KeyUploadDirs, policy.uploadDirs))
            || (false == ReadFlag(section, sectionName, KeyUploadSingleDir, policy.uploadSingleDir))
            || (false == ReadFlag(section, sectionName, KeyUploadIfChanged, policy.uploadIfChanged)))
        {
            return std::nullopt;
        }

        const auto excludePrefix = section.get_optional<std::string>(pt::ptree::path_type(KeyExcludePrefix, '\0'));
        if ((true == excludePrefix.has_value()) && (false == excludePrefix->empty()))
        {
            policy.excludePrefix = *excludePrefix;
        }

        targets.push_back(target);
    }
    return targets;
}

std::optional<std::vector<BackupTarget>> LoadBackupTargets(const fs::path& configFile)
{
    std::ifstream inputStream(configFile);
    if (false == inputStream.is_open())
    {
        spdlog::error("cannot open config file {}", configFile.string());
        return std::nullopt;
    }
    return ParseBackupTargets(inputStream, configFile.string());
}

BackupTarget SingleUploadTarget(const fs::path& path)
{
    BackupTarget target;
    target.path = StripTrailingSeparators(path.string());
    target.policy.uploadSingleDir = true;
    return target;
}
