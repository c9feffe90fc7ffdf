#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <cstddef>
#include <istream>
#include <map>
#include <ostream>
#include <string>

/**
 * @brief Minimal INI store: "[Section]" headers and "key = value" lines.
 *
 * Lines starting with ';' or '#' are comments. Keys before the first header
 * land in the unnamed section. Lines that are neither are skipped and counted.
 */
class IniConfig {
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    // Returns the number of malformed lines that were skipped.
    std::size_t parse(std::istream& input);
    void write(std::ostream& output) const;

    std::string getValue(const std::string& section,
                         const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;

private:
    using Section = std::map<std::string, std::string>;

    const std::string* find_value(const std::string& section, const std::string& key) const;

    std::map<std::string, Section> data;
};

#endif
