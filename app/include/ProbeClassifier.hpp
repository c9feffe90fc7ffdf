#ifndef PROBE_CLASSIFIER_HPP
#define PROBE_CLASSIFIER_HPP

#include "Types.hpp"

#include <string>
#include <utility>

/**
 * @brief Outcome of one HTTP round trip for a key.
 */
struct ProbeAttempt {
    enum class Kind {
        Response,          ///< The server answered with a status code.
        Timeout,           ///< Connect or read deadline passed.
        TransportFailure,  ///< Connection refused/reset, DNS, TLS and similar.
        Aborted,           ///< The transfer was cut short; a final error unless a stop was requested.
        Unexpected         ///< Non-network failure while preparing or running the attempt.
    };

    Kind kind{Kind::Response};
    long http_status{0};
    std::string text;  ///< Response body, or the failure message.

    static ProbeAttempt response(long status, std::string body) {
        return {Kind::Response, status, std::move(body)};
    }
    static ProbeAttempt timeout() {
        return {Kind::Timeout, HttpStatusSentinel::kNoResponse, {}};
    }
    static ProbeAttempt transport_failure(std::string message) {
        return {Kind::TransportFailure, HttpStatusSentinel::kNoResponse, std::move(message)};
    }
    static ProbeAttempt aborted() {
        return {Kind::Aborted, HttpStatusSentinel::kNoResponse, {}};
    }
    static ProbeAttempt unexpected(std::string message) {
        return {Kind::Unexpected, HttpStatusSentinel::kUnexpected, std::move(message)};
    }
};

struct Classification {
    ProbeStatus status{ProbeStatus::Error};
    long http_status{HttpStatusSentinel::kNoResponse};
    std::string detail;
    /// True when another attempt may change the outcome. The detail and status
    /// above are what the key ends with if no attempts remain.
    bool retryable{false};
};

namespace ProbeClassifier {

constexpr long kTooManyRequests = 429;

Classification classify(const ProbeAttempt& attempt);

Classification classify_response(long http_status, const std::string& body);

} // namespace ProbeClassifier

#endif
