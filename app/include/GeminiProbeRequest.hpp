#ifndef GEMINI_PROBE_REQUEST_HPP
#define GEMINI_PROBE_REQUEST_HPP

#include "IHttpTransport.hpp"

#include <string>
#include <vector>

/**
 * @brief Builds the generateContent request used to test a key.
 */
class GeminiProbeRequest {
public:
    GeminiProbeRequest(std::string endpoint_template, std::string model, long timeout_seconds);

    const std::string& endpoint() const { return endpoint_; }
    const std::string& payload() const { return payload_; }
    long timeout_seconds() const { return timeout_seconds_; }

    HttpRequest build_for_key(const std::string& api_key) const;

    static std::string build_endpoint(const std::string& endpoint_template, const std::string& model);
    static std::string make_payload();

private:
    std::string endpoint_;
    std::string payload_;
    long timeout_seconds_;
};

#endif // GEMINI_PROBE_REQUEST_HPP
