#pragma once
#include <string>
#include <vector>

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;
    std::string body;
    long timeout_seconds{10};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

/**
 * @brief Performs a single HTTP POST round trip.
 *
 * Implementations throw TransportTimeoutError when the connect or read
 * deadline passes, TransportAbortedError when a stop was requested, and
 * TransportError for any other network failure. Any HTTP status, including
 * 4xx and 5xx, is a successful return.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse post(const HttpRequest& request) = 0;
};
