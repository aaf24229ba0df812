#include "BackupLogging/BackupLogging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{
constexpr const char* LoggerName = "vault-backup";
constexpr const char* LogPattern = "%Y-%m-%d %H:%M:%S - %n - %l - %v";
}

void ConfigureLogging(const LoggingConfig& config)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::optional<std::string> fileSinkError;
    if (true == config.logFile.has_value())
    {
        try
        {
            std::error_code errorCode;
            fs::create_directories(config.logFile->parent_path(), errorCode);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logFile->string(), false));
        }
        catch (const spdlog::spdlog_ex& error)
        {
            fileSinkError = error.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(LogPattern);
    logger->set_level((true == config.verbose) ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (true == fileSinkError.has_value())
    {
        spdlog::warn("cannot open log file {}: {}", config.logFile->string(), *fileSinkError);
    }
}
