#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

enum class Code : int {
    // Network setup (1000-1099)
    NETWORK_INIT_FAILED = 1000,
    NETWORK_HANDLE_FAILED = 1001,

    // Input (1200-1299)
    INPUT_FILE_NOT_FOUND = 1200,
    INPUT_FILE_UNREADABLE = 1201,

    // Output (1300-1399)
    OUTPUT_WRITE_FAILED = 1300,
    OUTPUT_DIRECTORY_FAILED = 1301,

    // Configuration (1500-1599)
    CONFIG_INVALID = 1500,
    CONFIG_SAVE_FAILED = 1501,

    UNKNOWN_ERROR = 9999
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message plus resolution steps, suitable for the terminal
    std::string get_user_message() const;

    // Everything including the numeric code and context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
