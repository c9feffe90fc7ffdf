#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace ErrorCodes {

/**
 * @brief Run-level failure carrying a catalog code.
 *
 * what() returns the catalog message; get_full_details() adds the numeric
 * code, the context passed at the throw site and the resolution steps.
 */
class AppException : public std::runtime_error {
public:
    explicit AppException(Code code, const std::string& context = "")
        : AppException(ErrorCatalog::get_error_info(code, context)) {}

    // Replaces the catalog message but keeps its resolution.
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : AppException(ErrorInfo(code, custom_message,
                                 ErrorCatalog::get_error_info(code).resolution, context)) {}

    Code get_error_code() const noexcept { return error_info_.code; }
    int get_error_code_int() const noexcept { return static_cast<int>(error_info_.code); }

    const ErrorInfo& get_error_info() const noexcept { return error_info_; }
    const std::string& get_context() const noexcept { return error_info_.context; }

    std::string get_user_message() const { return error_info_.get_user_message(); }
    std::string get_full_details() const { return error_info_.get_full_details(); }

private:
    explicit AppException(ErrorInfo info)
        : std::runtime_error(info.message),
          error_info_(std::move(info)) {}

    ErrorInfo error_info_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APPEXCEPTION_HPP
