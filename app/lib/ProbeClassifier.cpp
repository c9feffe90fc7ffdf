#include "ProbeClassifier.hpp"
#include "Utils.hpp"

namespace {

std::string clip_detail(const std::string& text)
{
    return Utils::truncate_utf8(text, ProbeDefaults::kMaxDetailLength);
}

std::string clip_message(const std::string& text)
{
    return Utils::truncate_utf8(text, ProbeDefaults::kMaxErrorMessageLength);
}

}

namespace ProbeClassifier {

Classification classify_response(long http_status, const std::string& body)
{
    if (http_status >= 200 && http_status < 300) {
        return {ProbeStatus::Valid, http_status, "OK", false};
    }
    if (http_status == 401 || http_status == 403) {
        return {ProbeStatus::Invalid, http_status, clip_detail(body), false};
    }
    if (http_status == 404) {
        return {ProbeStatus::ModelNotFound, http_status, clip_detail(body), false};
    }
    if (http_status == kTooManyRequests) {
        return {ProbeStatus::Error, http_status, clip_detail(body), true};
    }
    return {ProbeStatus::Error, http_status, clip_detail(body), false};
}


Classification classify(const ProbeAttempt& attempt)
{
    switch (attempt.kind) {
        case ProbeAttempt::Kind::Response:
            return classify_response(attempt.http_status, attempt.text);
        case ProbeAttempt::Kind::Timeout:
            return {ProbeStatus::Error, HttpStatusSentinel::kNoResponse, "Timeout", true};
        case ProbeAttempt::Kind::TransportFailure:
            return {ProbeStatus::Error, HttpStatusSentinel::kNoResponse,
                    clip_detail("ClientError: " + clip_message(attempt.text)), true};
        case ProbeAttempt::Kind::Aborted:
            return {ProbeStatus::Error, HttpStatusSentinel::kNoResponse, "Aborted", false};
        case ProbeAttempt::Kind::Unexpected:
        default:
            return {ProbeStatus::Error, HttpStatusSentinel::kUnexpected,
                    clip_detail("Unexpected: " + clip_message(attempt.text)), false};
    }
}

} // namespace ProbeClassifier
