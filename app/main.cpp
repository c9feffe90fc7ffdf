#include "AppException.hpp"
#include "CommandLine.hpp"
#include "CurlTransport.hpp"
#include "GeminiProbeRequest.hpp"
#include "KeyCheckDispatcher.hpp"
#include "KeyListReader.hpp"
#include "KeyProber.hpp"
#include "Logger.hpp"
#include "ReportWriter.hpp"
#include "Settings.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>


namespace {

constexpr int kExitInterrupted = 130;
constexpr int kExitUsage = 2;

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int)
{
    g_stop_requested.store(true);
}

void install_signal_handlers()
{
    std::signal(SIGINT, handle_stop_signal);
#ifdef SIGTERM
    std::signal(SIGTERM, handle_stop_signal);
#endif
}

bool initialize_loggers(const Settings& settings, bool verbose)
{
    try {
        const auto level = verbose ? spdlog::level::debug
                                   : Logger::parse_level(settings.get_log_level(), spdlog::level::info);
        Logger::setup_loggers(settings.get_log_dir(),
                              verbose ? spdlog::level::debug : spdlog::level::warn,
                              level);
        return true;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

int run_probe(const CommandLineOptions& options, Settings& settings)
{
    const std::vector<std::string> keys = KeyListReader().read_file(options.input_path);
    if (keys.empty()) {
        std::cout << "Input file contains no keys." << std::endl;
        return EXIT_SUCCESS;
    }

    auto core_logger = Logger::get_logger("core_logger");

    CurlGlobal curl_global;
    CurlTransport transport(&g_stop_requested);
    KeyProber prober(transport,
                     GeminiProbeRequest(settings.get_endpoint_template(),
                                        settings.get_model(),
                                        settings.get_timeout_seconds()),
                     settings.get_retry_policy(),
                     {},
                     core_logger);

    if (core_logger) {
        core_logger->info("Testing {} key(s) against model '{}' (concurrency {}, timeout {}s)",
                          keys.size(), settings.get_model(), settings.get_concurrency(),
                          settings.get_timeout_seconds());
    }

    install_signal_handlers();

    std::mutex console_mutex;
    KeyCheckDispatcher dispatcher(prober, core_logger);
    const DispatchReport report = dispatcher.run(
        keys,
        settings.get_concurrency(),
        g_stop_requested,
        [&console_mutex](const ProgressEvent& event) {
            std::lock_guard<std::mutex> lock(console_mutex);
            std::cout << ReportWriter::format_progress_line(event) << std::endl;
        });

    if (report.interrupted) {
        std::cout << "Interrupted by user." << std::endl;
        return kExitInterrupted;
    }

    ReportWriter::write_results_csv(report.results, settings.get_results_file());
    const bool wrote_success = ReportWriter::write_success_file(report.valid_keys,
                                                                settings.get_success_file());

    const ProbeSummary summary = ReportWriter::summarize(report.results, keys.size());
    std::cout << "\n" << ReportWriter::format_summary(summary) << std::endl;
    if (wrote_success) {
        std::cout << "Valid keys written to " << settings.get_success_file() << std::endl;
    }
    return EXIT_SUCCESS;
}

} // namespace


int main(int argc, char **argv)
{
    CommandLineOptions options;
    try {
        options = CommandLine::parse(argc, argv);
    } catch (const CommandLineError& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n" << CommandLine::usage(argv[0]);
        return kExitUsage;
    }

    if (options.show_help) {
        std::cout << CommandLine::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    Settings settings;
    const bool settings_loaded = settings.load();
    CommandLine::apply_overrides(options, settings);
    if (!initialize_loggers(settings, options.verbose)) {
        std::fprintf(stderr, "Continuing without a log file.\n");
    }
    if (!settings_loaded) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("No settings at '{}', using defaults", settings.get_config_path());
        }
    }

    int exit_code = EXIT_SUCCESS;
    try {
        if (options.save_config) {
            if (!settings.save()) {
                THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, settings.get_config_path());
            }
            std::cout << "Settings written to " << settings.get_config_path() << std::endl;
        }
        if (!options.input_path.empty()) {
            exit_code = run_probe(options, settings);
        }
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("{}", ex.get_full_details());
        } else {
            std::cerr << ex.get_full_details() << std::endl;
        }
        exit_code = EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        exit_code = EXIT_FAILURE;
    }

    Logger::shutdown();
    return exit_code;
}
