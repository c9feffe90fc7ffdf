#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
public:
    /**
     * @brief Registers the application loggers.
     *
     * Every logger writes to a rotating file inside @p log_dir and to stderr
     * filtered at @p console_level. Throws spdlog::spdlog_ex or
     * std::filesystem::filesystem_error when the sinks cannot be created.
     */
    static void setup_loggers(const std::string& log_dir,
                              spdlog::level::level_enum console_level = spdlog::level::warn,
                              spdlog::level::level_enum file_level = spdlog::level::info);

    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static spdlog::level::level_enum parse_level(const std::string& value,
                                                 spdlog::level::level_enum fallback);

    static void shutdown();
};

#endif
