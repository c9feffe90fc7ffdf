#include "CommandLine.hpp"
#include "Settings.hpp"
#include "Types.hpp"

#include <spdlog/fmt/fmt.h>

#include <string_view>

namespace {

enum class OptionId {
    Output,
    Success,
    Concurrency,
    Timeout,
    Model,
    Verbose,
    SaveConfig,
    Help
};

struct OptionSpec {
    OptionId id;
    const char* long_name;
    const char* short_name;
    bool takes_value;
};

constexpr OptionSpec kOptions[] = {
    {OptionId::Output, "--output", "-o", true},
    {OptionId::Success, "--success", "-s", true},
    {OptionId::Concurrency, "--concurrency", "-c", true},
    {OptionId::Timeout, "--timeout", "-t", true},
    {OptionId::Model, "--model", "-m", true},
    {OptionId::Verbose, "--verbose", "-v", false},
    {OptionId::SaveConfig, "--save-config", nullptr, false},
    {OptionId::Help, "--help", "-h", false},
};

const OptionSpec* find_option(std::string_view name)
{
    for (const auto& spec : kOptions) {
        if (name == spec.long_name || (spec.short_name && name == spec.short_name)) {
            return &spec;
        }
    }
    return nullptr;
}

int parse_positive_int(const std::string& option, const std::string& value)
{
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw CommandLineError(fmt::format("{} expects an integer, got '{}'", option, value));
    }
    if (consumed != value.size()) {
        throw CommandLineError(fmt::format("{} expects an integer, got '{}'", option, value));
    }
    if (parsed < 1) {
        throw CommandLineError(fmt::format("{} must be at least 1, got {}", option, parsed));
    }
    return parsed;
}

void assign_option(const OptionSpec& spec, const std::string& value, CommandLineOptions& options)
{
    switch (spec.id) {
        case OptionId::Output: options.output_path = value; break;
        case OptionId::Success: options.success_path = value; break;
        case OptionId::Concurrency: options.concurrency = parse_positive_int(spec.long_name, value); break;
        case OptionId::Timeout: options.timeout_seconds = parse_positive_int(spec.long_name, value); break;
        case OptionId::Model:
            if (value.empty()) {
                throw CommandLineError("--model must not be empty");
            }
            options.model = value;
            break;
        case OptionId::Verbose: options.verbose = true; break;
        case OptionId::SaveConfig: options.save_config = true; break;
        case OptionId::Help: options.show_help = true; break;
    }
}

} // namespace

namespace CommandLine {

CommandLineOptions parse(int argc, const char* const* argv)
{
    CommandLineOptions options;
    bool positional_only = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (positional_only || arg.empty() || arg[0] != '-' || arg == "-") {
            if (!options.input_path.empty()) {
                throw CommandLineError("Unexpected extra argument: " + arg);
            }
            options.input_path = arg;
            continue;
        }
        if (arg == "--") {
            positional_only = true;
            continue;
        }

        std::string name = arg;
        std::optional<std::string> inline_value;
        if (const auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        const OptionSpec* spec = find_option(name);
        if (!spec) {
            throw CommandLineError("Unknown option: " + name);
        }

        if (!spec->takes_value) {
            if (inline_value) {
                throw CommandLineError(std::string(spec->long_name) + " does not take a value");
            }
            assign_option(*spec, {}, options);
            continue;
        }

        if (inline_value) {
            assign_option(*spec, *inline_value, options);
            continue;
        }
        if (i + 1 >= argc) {
            throw CommandLineError(std::string(spec->long_name) + " requires a value");
        }
        assign_option(*spec, argv[++i], options);
    }

    if (options.input_path.empty() && !options.show_help && !options.save_config) {
        throw CommandLineError("Missing key list file");
    }
    return options;
}


void apply_overrides(const CommandLineOptions& options, Settings& settings)
{
    if (options.output_path) {
        settings.set_results_file(*options.output_path);
    }
    if (options.success_path) {
        settings.set_success_file(*options.success_path);
    }
    if (options.concurrency) {
        settings.set_concurrency(*options.concurrency);
    }
    if (options.timeout_seconds) {
        settings.set_timeout_seconds(*options.timeout_seconds);
    }
    if (options.model) {
        settings.set_model(*options.model);
    }
}


std::string usage(const std::string& program_name)
{
    return fmt::format(
        "Usage: {0} <keys.txt> [options]\n"
        "\n"
        "Checks each API key (one per line) against the Gemini generateContent\n"
        "endpoint and reports whether it can use the selected model.\n"
        "\n"
        "Options:\n"
        "  -o, --output <file>        CSV report (default {1})\n"
        "  -s, --success <file>       valid keys, sorted (default {2})\n"
        "  -c, --concurrency <n>      parallel requests (default {3})\n"
        "  -t, --timeout <seconds>    connect/read timeout per attempt (default {4})\n"
        "  -m, --model <name>         model to test (default {5})\n"
        "  -v, --verbose              debug logging for this run only\n"
        "      --save-config          save config.ini with the -o/-s/-c/-t/-m values given\n"
        "  -h, --help                 show this text\n",
        program_name,
        ProbeDefaults::kResultsFile,
        ProbeDefaults::kSuccessFile,
        ProbeDefaults::kConcurrency,
        ProbeDefaults::kTimeoutSeconds,
        ProbeDefaults::kModel);
}

} // namespace CommandLine
