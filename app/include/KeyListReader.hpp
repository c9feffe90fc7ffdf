#ifndef KEY_LIST_READER_HPP
#define KEY_LIST_READER_HPP

#include <istream>
#include <string>
#include <vector>

class KeyListReader {
public:
    KeyListReader() = default;

    /**
     * @brief Reads one key per line from @p path.
     *
     * Throws ErrorCodes::AppException when the file is missing or unreadable.
     */
    std::vector<std::string> read_file(const std::string& path) const;

    // Trims each line and drops blank ones. Order and duplicates are preserved.
    std::vector<std::string> parse(std::istream& input) const;
};

#endif
