#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char* kLogFileName = "key_probe.log";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLoggerNames[] = {"core_logger", "net_logger"};
}


void Logger::setup_loggers(const std::string& log_dir,
                           spdlog::level::level_enum console_level,
                           spdlog::level::level_enum file_level)
{
    std::filesystem::create_directories(log_dir);
    const std::string log_path = (std::filesystem::path(log_dir) / kLogFileName).string();

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_path, kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_level(file_level);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(console_level);
    console_sink->set_pattern("[%^%l%$] %v");

    const std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};
    for (const char* name : kLoggerNames) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(std::min(console_level, file_level));
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


spdlog::level::level_enum Logger::parse_level(const std::string& value,
                                              spdlog::level::level_enum fallback)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered.empty()) {
        return fallback;
    }
    if (lowered == "warning") {
        return spdlog::level::warn;
    }
    const auto level = spdlog::level::from_str(lowered);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && lowered != "off") {
        return fallback;
    }
    return level;
}


void Logger::shutdown()
{
    spdlog::shutdown();
}
