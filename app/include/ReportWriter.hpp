#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include "KeyCheckDispatcher.hpp"
#include "Types.hpp"

#include <cstddef>
#include <ostream>
#include <set>
#include <string>
#include <vector>

struct ProbeSummary {
    std::size_t total{0};
    std::size_t valid{0};
    std::size_t invalid{0};
    std::size_t model_not_found{0};
    std::size_t other_errors{0};
};

namespace ReportWriter {

/**
 * @brief Writes the CSV report (header plus one row per result).
 *
 * Throws ErrorCodes::AppException when the file cannot be written.
 */
void write_results_csv(const std::vector<ProbeResult>& results, const std::string& path);
void write_results_csv(const std::vector<ProbeResult>& results, std::ostream& out);

/**
 * @brief Writes the sorted valid keys, one per line.
 *
 * Nothing is written and false is returned when @p valid_keys is empty.
 */
bool write_success_file(const std::set<std::string>& valid_keys, const std::string& path);

std::string escape_csv_field(const std::string& field);

// Elapsed seconds with two decimals.
std::string format_elapsed(double seconds);

ProbeSummary summarize(const std::vector<ProbeResult>& results, std::size_t total_keys);

std::string format_summary(const ProbeSummary& summary);

std::string format_progress_line(const ProgressEvent& event);

} // namespace ReportWriter

#endif
