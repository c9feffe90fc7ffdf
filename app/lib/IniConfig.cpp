#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <fstream>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

bool is_comment(const std::string& line)
{
    return line.front() == ';' || line.front() == '#';
}
}


bool IniConfig::load(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::debug, "No config file at {}", filename);
        return false;
    }

    if (const std::size_t skipped = parse(file); skipped > 0) {
        ini_log(spdlog::level::warn, "Skipped {} malformed line(s) in {}", skipped, filename);
    }
    return true;
}


std::size_t IniConfig::parse(std::istream& input)
{
    std::string raw_line;
    std::string section;
    std::size_t line_number = 0;
    std::size_t skipped = 0;

    while (std::getline(input, raw_line)) {
        ++line_number;
        const std::string line = Utils::trim_copy(raw_line);
        if (line.empty() || is_comment(line)) {
            continue;
        }

        if (line.front() == '[') {
            if (line.size() < 2 || line.back() != ']') {
                ini_log(spdlog::level::debug, "Line {}: unterminated section header", line_number);
                ++skipped;
                continue;
            }
            section = Utils::trim_copy(std::string_view(line).substr(1, line.size() - 2));
            continue;
        }

        const auto delimiter = line.find('=');
        std::string key = delimiter == std::string::npos
            ? std::string()
            : Utils::trim_copy(std::string_view(line).substr(0, delimiter));
        if (key.empty()) {
            ini_log(spdlog::level::debug, "Line {}: expected key = value", line_number);
            ++skipped;
            continue;
        }
        data[section][std::move(key)] = Utils::trim_copy(std::string_view(line).substr(delimiter + 1));
    }
    return skipped;
}


void IniConfig::write(std::ostream& output) const
{
    bool first = true;
    for (const auto& [section, values] : data) {
        if (!first) {
            output << '\n';
        }
        first = false;
        if (!section.empty()) {
            output << '[' << section << "]\n";
        }
        for (const auto& [key, value] : values) {
            output << key << " = " << value << '\n';
        }
    }
}


bool IniConfig::save(const std::string& filename) const
{
    std::ofstream file(filename, std::ios::trunc);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file: {}", filename);
        return false;
    }

    write(file);
    file.flush();
    if (!file) {
        ini_log(spdlog::level::err, "Failed to write config file: {}", filename);
        return false;
    }
    return true;
}


const std::string* IniConfig::find_value(const std::string& section, const std::string& key) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return nullptr;
    }
    const auto key_it = sec_it->second.find(key);
    return key_it == sec_it->second.end() ? nullptr : &key_it->second;
}


std::string IniConfig::getValue(const std::string& section,
                                const std::string& key,
                                const std::string& default_value) const
{
    const std::string* value = find_value(section, key);
    return value ? *value : default_value;
}


void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value)
{
    data[section][key] = value;
}


bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    return find_value(section, key) != nullptr;
}
