#include "CurlTransport.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "TransportErrors.hpp"

#include <curl/curl.h>

#include <array>
#include <string>

namespace {

struct CurlDefaults {
    static constexpr long FOLLOW_LOCATION = 1L;
    static constexpr long MAX_REDIRECTS = 5L;
    static constexpr long NO_SIGNAL = 1L;
    static constexpr long NO_PROGRESS = 0L;
    static constexpr long LOW_SPEED_LIMIT_BYTES = 1L;
    static constexpr const char* USER_AGENT = "key-probe/1.0";
};

struct EasyHandle {
    CURL* handle{curl_easy_init()};
    curl_slist* headers{nullptr};

    EasyHandle() = default;
    ~EasyHandle() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;
};

} // namespace


CurlGlobal::CurlGlobal()
{
    const CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
        THROW_APP_ERROR(ErrorCodes::Code::NETWORK_INIT_FAILED, curl_easy_strerror(rc));
    }
}


CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}


CurlTransport::CurlTransport(const std::atomic<bool>* stop_flag)
    : stop_flag_(stop_flag),
      user_agent_(CurlDefaults::USER_AGENT),
      logger_(Logger::get_logger("net_logger"))
{
}


void CurlTransport::set_user_agent(std::string user_agent)
{
    user_agent_ = std::move(user_agent);
}


size_t CurlTransport::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* body = static_cast<std::string*>(userdata);
    const size_t total = size * nmemb;
    body->append(ptr, total);
    return total;
}


int CurlTransport::progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto* stop_flag = static_cast<const std::atomic<bool>*>(clientp);
    if (stop_flag && stop_flag->load()) {
        return 1;
    }
    return 0;
}


HttpResponse CurlTransport::post(const HttpRequest& request)
{
    EasyHandle easy;
    if (!easy.handle) {
        THROW_APP_ERROR(ErrorCodes::Code::NETWORK_HANDLE_FAILED, request.url);
    }

    std::string response_body;
    std::array<char, CURL_ERROR_SIZE> error_buffer{};

    for (const auto& header : request.headers) {
        easy.headers = curl_slist_append(easy.headers, header.c_str());
    }

    CURL* curl = easy.handle;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, easy.headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer.data());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // required with worker threads

    // Per-attempt deadlines: connect, then read stalls. There is no total cap.
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, request.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, CurlDefaults::LOW_SPEED_LIMIT_BYTES);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, request.timeout_seconds);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlTransport::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);

    if (stop_flag_) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &CurlTransport::progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(stop_flag_));
    }

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        const std::string message = error_buffer[0] != '\0'
            ? std::string(error_buffer.data())
            : std::string(curl_easy_strerror(rc));
        if (logger_) {
            logger_->debug("POST {} failed (curl code {}): {}", request.url, static_cast<int>(rc), message);
        }
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            throw TransportTimeoutError(message);
        }
        if (rc == CURLE_ABORTED_BY_CALLBACK) {
            throw TransportAbortedError(message);
        }
        throw TransportError(message);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (logger_) {
        logger_->debug("POST {} returned HTTP {} ({} bytes)", request.url, http_code, response_body.size());
    }

    return HttpResponse{http_code, std::move(response_body)};
}
