#ifndef CURL_TRANSPORT_HPP
#define CURL_TRANSPORT_HPP

#include "IHttpTransport.hpp"
#include <curl/system.h>

#include <atomic>
#include <memory>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief RAII guard around curl_global_init / curl_global_cleanup.
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
    CurlGlobal(CurlGlobal&&) = delete;
    CurlGlobal& operator=(CurlGlobal&&) = delete;
};

/**
 * @brief libcurl-backed transport.
 *
 * Each post() uses its own easy handle, so one instance may be shared by
 * several worker threads.
 */
class CurlTransport : public IHttpTransport {
public:
    /**
     * @param stop_flag Optional flag polled while a transfer runs; the
     *        transfer is aborted once it becomes true.
     */
    explicit CurlTransport(const std::atomic<bool>* stop_flag = nullptr);
    ~CurlTransport() override = default;

    HttpResponse post(const HttpRequest& request) override;

    void set_user_agent(std::string user_agent);

private:
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                 curl_off_t ultotal, curl_off_t ulnow);

    const std::atomic<bool>* stop_flag_;
    std::string user_agent_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // CURL_TRANSPORT_HPP
