#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace Utils {

std::string trim_copy(std::string_view input);

/**
 * @brief Truncates UTF-8 text to at most @p max_chars code points.
 *
 * The cut never lands inside a multi-byte sequence. Invalid bytes count as
 * one character each.
 */
std::string truncate_utf8(std::string_view text, std::size_t max_chars);

// First six characters of a key followed by "..." for logs and progress output.
std::string mask_key(std::string_view key);

double round_to_hundredths(double value);

std::filesystem::path utf8_to_path(const std::string& value);

} // namespace Utils

#endif
