#include "ErrorCode.hpp"

#include <sstream>

namespace ErrorCodes {

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n" + resolution;
}


std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << ": " << message;
    if (!context.empty()) {
        oss << "\nDetails: " << context;
    }
    if (!resolution.empty()) {
        oss << "\nResolution: " << resolution;
    }
    return oss.str();
}


ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::NETWORK_INIT_FAILED:
            return {code,
                    "Failed to initialize the network library.",
                    "Verify that libcurl is installed and supports HTTPS.",
                    context};
        case Code::NETWORK_HANDLE_FAILED:
            return {code,
                    "Failed to create a network request handle.",
                    "The system may be out of memory or file descriptors. Lower --concurrency and retry.",
                    context};
        case Code::INPUT_FILE_NOT_FOUND:
            return {code,
                    "The key list file does not exist.",
                    "Check the path passed as the first argument.",
                    context};
        case Code::INPUT_FILE_UNREADABLE:
            return {code,
                    "The key list file could not be read.",
                    "Check file permissions and that the path is a regular file.",
                    context};
        case Code::OUTPUT_WRITE_FAILED:
            return {code,
                    "Failed to write an output file.",
                    "Check that the destination is writable and the disk is not full.",
                    context};
        case Code::OUTPUT_DIRECTORY_FAILED:
            return {code,
                    "Failed to create the output directory.",
                    "Check permissions on the parent directory.",
                    context};
        case Code::CONFIG_INVALID:
            return {code,
                    "The configuration is invalid.",
                    "Fix the reported value in config.ini or on the command line.",
                    context};
        case Code::CONFIG_SAVE_FAILED:
            return {code,
                    "Failed to save the configuration file.",
                    "Check permissions on the configuration directory (see KEY_PROBE_CONFIG_DIR).",
                    context};
        case Code::UNKNOWN_ERROR:
        default:
            return {Code::UNKNOWN_ERROR,
                    "An unexpected error occurred.",
                    "Re-run with --verbose and check the log file.",
                    context};
    }
}

} // namespace ErrorCodes
