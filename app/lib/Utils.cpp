#include "Utils.hpp"

#include <cctype>
#include <cmath>

namespace {
constexpr std::size_t kMaskedPrefixLength = 6;

bool is_continuation_byte(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

// Continuation bytes announced by a lead byte; 0 for ASCII and invalid leads.
std::size_t expected_continuations(unsigned char lead)
{
    if ((lead & 0xE0) == 0xC0) {
        return 1;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 2;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 3;
    }
    return 0;
}
}

namespace Utils {

std::string trim_copy(std::string_view input)
{
    std::size_t begin = 0;
    while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin]))) {
        ++begin;
    }
    std::size_t end = input.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return std::string(input.substr(begin, end - begin));
}


std::string truncate_utf8(std::string_view text, std::size_t max_chars)
{
    std::size_t chars = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (chars == max_chars) {
            return std::string(text.substr(0, pos));
        }
        std::size_t remaining = expected_continuations(static_cast<unsigned char>(text[pos]));
        ++pos;
        while (remaining > 0 && pos < text.size() &&
               is_continuation_byte(static_cast<unsigned char>(text[pos]))) {
            ++pos;
            --remaining;
        }
        ++chars;
    }
    return std::string(text);
}


std::string mask_key(std::string_view key)
{
    return truncate_utf8(key, kMaskedPrefixLength) + "...";
}


double round_to_hundredths(double value)
{
    return std::round(value * 100.0) / 100.0;
}


std::filesystem::path utf8_to_path(const std::string& value)
{
#ifdef _WIN32
    return std::filesystem::u8path(value);
#else
    return std::filesystem::path(value);
#endif
}

} // namespace Utils
