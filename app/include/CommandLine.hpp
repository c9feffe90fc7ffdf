#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <optional>
#include <stdexcept>
#include <string>

class Settings;

class CommandLineError : public std::runtime_error {
public:
    explicit CommandLineError(const std::string& message)
        : std::runtime_error(message) {}
};

struct CommandLineOptions {
    std::string input_path;
    std::optional<std::string> output_path;
    std::optional<std::string> success_path;
    std::optional<int> concurrency;
    std::optional<int> timeout_seconds;
    std::optional<std::string> model;
    bool verbose{false};
    bool save_config{false};
    bool show_help{false};
};

namespace CommandLine {

/**
 * @brief Parses argv into options.
 *
 * Accepts "--name value", "--name=value" and the short forms "-o value".
 * Throws CommandLineError on unknown options, missing values, non-numeric or
 * out-of-range numbers, or a missing input path (unless --help is given).
 */
CommandLineOptions parse(int argc, const char* const* argv);

// Overrides settings values with whatever was given on the command line.
// --verbose is not a setting and leaves the stored log level alone.
void apply_overrides(const CommandLineOptions& options, Settings& settings);

std::string usage(const std::string& program_name);

} // namespace CommandLine

#endif
