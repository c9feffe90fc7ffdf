#include "KeyListReader.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <filesystem>
#include <fstream>

namespace {
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
}


std::vector<std::string> KeyListReader::read_file(const std::string& path) const
{
    const std::filesystem::path file_path = Utils::utf8_to_path(path);
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::INPUT_FILE_NOT_FOUND, "Path: " + path);
    }
    if (std::filesystem::is_directory(file_path, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::INPUT_FILE_UNREADABLE, "Path is a directory: " + path);
    }

    std::ifstream input(file_path, std::ios::binary);
    if (!input.is_open()) {
        THROW_APP_ERROR(ErrorCodes::Code::INPUT_FILE_UNREADABLE, "Path: " + path);
    }

    std::vector<std::string> keys = parse(input);
    if (input.bad()) {
        THROW_APP_ERROR(ErrorCodes::Code::INPUT_FILE_UNREADABLE, "Read failed: " + path);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded {} key(s) from '{}'", keys.size(), path);
    }
    return keys;
}


std::vector<std::string> KeyListReader::parse(std::istream& input) const
{
    std::vector<std::string> keys;
    std::string line;
    bool first_line = true;
    while (std::getline(input, line)) {
        std::string_view view(line);
        if (first_line && view.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
            view.remove_prefix(kUtf8Bom.size());
        }
        first_line = false;

        std::string key = Utils::trim_copy(view);
        if (!key.empty()) {
            keys.push_back(std::move(key));
        }
    }
    return keys;
}
