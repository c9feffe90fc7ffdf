#include "ReportWriter.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <filesystem>
#include <fstream>

namespace {
constexpr const char* kCsvLineEnd = "\r\n";
constexpr const char* kCsvHeader[] = {"key", "status", "http_status", "detail", "elapsed_seconds"};

void ensure_parent_directory(const std::filesystem::path& path)
{
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::OUTPUT_DIRECTORY_FAILED,
                            "Failed to create output directory " + parent.string(),
                            ec.message());
    }
}

std::ofstream open_for_write(const std::string& path)
{
    const std::filesystem::path file_path = Utils::utf8_to_path(path);
    ensure_parent_directory(file_path);
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::OUTPUT_WRITE_FAILED, "Path: " + path);
    }
    return out;
}

void finish_write(std::ofstream& out, const std::string& path)
{
    out.flush();
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::OUTPUT_WRITE_FAILED, "Path: " + path);
    }
}
}

namespace ReportWriter {

std::string escape_csv_field(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string escaped;
    escaped.reserve(field.size() + 2);
    escaped.push_back('"');
    for (char c : field) {
        if (c == '"') {
            escaped.push_back('"');
        }
        escaped.push_back(c);
    }
    escaped.push_back('"');
    return escaped;
}


std::string format_elapsed(double seconds)
{
    return fmt::format("{:.2f}", seconds);
}


void write_results_csv(const std::vector<ProbeResult>& results, std::ostream& out)
{
    bool first = true;
    for (const char* column : kCsvHeader) {
        if (!first) {
            out << ',';
        }
        out << column;
        first = false;
    }
    out << kCsvLineEnd;

    for (const auto& result : results) {
        out << escape_csv_field(result.key) << ','
            << to_string(result.status) << ','
            << result.http_status << ','
            << escape_csv_field(result.detail) << ','
            << format_elapsed(result.elapsed_seconds) << kCsvLineEnd;
    }
}


void write_results_csv(const std::vector<ProbeResult>& results, const std::string& path)
{
    std::ofstream out = open_for_write(path);
    write_results_csv(results, out);
    finish_write(out, path);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Wrote {} result row(s) to '{}'", results.size(), path);
    }
}


bool write_success_file(const std::set<std::string>& valid_keys, const std::string& path)
{
    if (valid_keys.empty()) {
        return false;
    }

    std::ofstream out = open_for_write(path);
    for (const auto& key : valid_keys) {
        out << key << '\n';
    }
    finish_write(out, path);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Wrote {} valid key(s) to '{}'", valid_keys.size(), path);
    }
    return true;
}


ProbeSummary summarize(const std::vector<ProbeResult>& results, std::size_t total_keys)
{
    ProbeSummary summary;
    summary.total = total_keys;
    for (const auto& result : results) {
        switch (result.status) {
            case ProbeStatus::Valid: ++summary.valid; break;
            case ProbeStatus::Invalid: ++summary.invalid; break;
            case ProbeStatus::ModelNotFound: ++summary.model_not_found; break;
            case ProbeStatus::Error: break;
        }
    }
    const std::size_t classified = summary.valid + summary.invalid + summary.model_not_found;
    summary.other_errors = total_keys > classified ? total_keys - classified : 0;
    return summary;
}


std::string format_summary(const ProbeSummary& summary)
{
    return fmt::format("Done: total {}, valid {}, invalid {}, model_not_found {}, other errors {}.",
                       summary.total, summary.valid, summary.invalid,
                       summary.model_not_found, summary.other_errors);
}


std::string format_progress_line(const ProgressEvent& event)
{
    return fmt::format("[{}/{}] key={} status={} http={} t={}s",
                       event.completed, event.total,
                       Utils::mask_key(event.result.key),
                       to_string(event.result.status),
                       event.result.http_status,
                       format_elapsed(event.result.elapsed_seconds));
}

} // namespace ReportWriter
