#include "Settings.hpp"
#include "Logger.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <utility>


namespace {
constexpr const char* kAppName = "KeyProbe";
constexpr const char* kConfigFileName = "config.ini";
constexpr const char* kConfigDirEnv = "KEY_PROBE_CONFIG_DIR";

constexpr const char* kProbeSection = "Probe";
constexpr const char* kRetrySection = "Retry";
constexpr const char* kOutputSection = "Output";
constexpr const char* kLoggingSection = "Logging";

constexpr double kMaxInitialBackoffSeconds = 300.0;
constexpr double kMaxBackoffFactor = 10.0;

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

template <typename T, typename Parser>
std::optional<T> parse_number(const std::string& value, Parser parser) {
    try {
        std::size_t consumed = 0;
        const T parsed = parser(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return std::nullopt;
}

int parse_int_at_least(const std::string& key, const std::string& value, int minimum, int fallback) {
    const auto parsed = parse_number<int>(value, [](const std::string& s, std::size_t* pos) {
        return std::stoi(s, pos);
    });
    if (parsed && *parsed >= minimum) {
        return *parsed;
    }
    settings_log(spdlog::level::warn, "Ignoring invalid {} '{}', using {}", key, value, fallback);
    return fallback;
}

double parse_double_in_range(const std::string& key, const std::string& value,
                             double minimum, double maximum, double fallback) {
    const auto parsed = parse_number<double>(value, [](const std::string& s, std::size_t* pos) {
        return std::stod(s, pos);
    });
    if (parsed && std::isfinite(*parsed) && *parsed >= minimum && *parsed <= maximum) {
        return *parsed;
    }
    settings_log(spdlog::level::warn, "Ignoring invalid {} '{}', using {}", key, value, fallback);
    return fallback;
}

std::string format_double(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string non_empty_or(const std::string& value, const std::string& fallback) {
    return value.empty() ? fallback : value;
}
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();
}


std::string Settings::define_config_path()
{
    if (const char* override_root = std::getenv(kConfigDirEnv); override_root && *override_root) {
        std::filesystem::path base = override_root;
        return (base / kAppName / kConfigFileName).string();
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (std::filesystem::path(xdg) / kAppName / kConfigFileName).string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (std::filesystem::path(home) / ".config" / kAppName / kConfigFileName).string();
    }
    return kConfigFileName;
}


std::string Settings::get_config_dir() const
{
    return config_dir.string();
}


std::string Settings::get_config_path() const
{
    return config_path;
}


std::string Settings::get_log_dir() const
{
    return (config_dir / "logs").string();
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    model = non_empty_or(config.getValue(kProbeSection, "Model", model), ProbeDefaults::kModel);
    endpoint_template = non_empty_or(config.getValue(kProbeSection, "EndpointTemplate", endpoint_template),
                                     ProbeDefaults::kEndpointTemplate);
    if (endpoint_template.find("{model}") == std::string::npos) {
        settings_log(spdlog::level::warn, "EndpointTemplate '{}' has no {{model}} placeholder, using {}",
                     endpoint_template, ProbeDefaults::kEndpointTemplate);
        endpoint_template = ProbeDefaults::kEndpointTemplate;
    }

    if (config.hasValue(kProbeSection, "Concurrency")) {
        concurrency = parse_int_at_least("Concurrency", config.getValue(kProbeSection, "Concurrency"),
                                         1, ProbeDefaults::kConcurrency);
    }
    if (config.hasValue(kProbeSection, "TimeoutSeconds")) {
        timeout_seconds = parse_int_at_least("TimeoutSeconds", config.getValue(kProbeSection, "TimeoutSeconds"),
                                             1, ProbeDefaults::kTimeoutSeconds);
    }

    if (config.hasValue(kRetrySection, "MaxAttempts")) {
        retry_policy.max_attempts = parse_int_at_least("MaxAttempts", config.getValue(kRetrySection, "MaxAttempts"),
                                                       1, ProbeDefaults::kMaxAttempts);
    }
    if (config.hasValue(kRetrySection, "InitialBackoffSeconds")) {
        retry_policy.initial_backoff_seconds = parse_double_in_range(
            "InitialBackoffSeconds", config.getValue(kRetrySection, "InitialBackoffSeconds"),
            0.0, kMaxInitialBackoffSeconds, ProbeDefaults::kInitialBackoffSeconds);
    }
    if (config.hasValue(kRetrySection, "BackoffFactor")) {
        retry_policy.backoff_factor = parse_double_in_range(
            "BackoffFactor", config.getValue(kRetrySection, "BackoffFactor"),
            1.0, kMaxBackoffFactor, ProbeDefaults::kBackoffFactor);
    }

    results_file = non_empty_or(config.getValue(kOutputSection, "ResultsFile", results_file),
                                ProbeDefaults::kResultsFile);
    success_file = non_empty_or(config.getValue(kOutputSection, "SuccessFile", success_file),
                                ProbeDefaults::kSuccessFile);
    log_level = non_empty_or(config.getValue(kLoggingSection, "Level", log_level), "info");

    settings_log(spdlog::level::info,
                 "Loaded settings from '{}' (model: {}, concurrency: {}, timeout: {}s, attempts: {})",
                 config_path, model, concurrency, timeout_seconds, retry_policy.max_attempts);
    return true;
}


bool Settings::save()
{
    config.setValue(kProbeSection, "Model", model);
    config.setValue(kProbeSection, "EndpointTemplate", endpoint_template);
    config.setValue(kProbeSection, "Concurrency", std::to_string(concurrency));
    config.setValue(kProbeSection, "TimeoutSeconds", std::to_string(timeout_seconds));
    config.setValue(kRetrySection, "MaxAttempts", std::to_string(retry_policy.max_attempts));
    config.setValue(kRetrySection, "InitialBackoffSeconds", format_double(retry_policy.initial_backoff_seconds));
    config.setValue(kRetrySection, "BackoffFactor", format_double(retry_policy.backoff_factor));
    config.setValue(kOutputSection, "ResultsFile", results_file);
    config.setValue(kOutputSection, "SuccessFile", success_file);
    config.setValue(kLoggingSection, "Level", log_level);

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
        return false;
    }

    return config.save(config_path);
}


std::string Settings::get_model() const { return model; }
void Settings::set_model(const std::string& value) { model = value; }

std::string Settings::get_endpoint_template() const { return endpoint_template; }
void Settings::set_endpoint_template(const std::string& value) { endpoint_template = value; }

int Settings::get_concurrency() const { return concurrency; }
void Settings::set_concurrency(int value) { concurrency = value; }

int Settings::get_timeout_seconds() const { return timeout_seconds; }
void Settings::set_timeout_seconds(int value) { timeout_seconds = value; }

RetryPolicy Settings::get_retry_policy() const { return retry_policy; }
void Settings::set_retry_policy(const RetryPolicy& policy) { retry_policy = policy; }

std::string Settings::get_results_file() const { return results_file; }
void Settings::set_results_file(const std::string& path) { results_file = path; }

std::string Settings::get_success_file() const { return success_file; }
void Settings::set_success_file(const std::string& path) { success_file = path; }

std::string Settings::get_log_level() const { return log_level; }
void Settings::set_log_level(const std::string& level) { log_level = level; }
