#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstddef>
#include <string>

enum class ProbeStatus {
    Valid,
    Invalid,
    ModelNotFound,
    Error
};

inline std::string to_string(ProbeStatus status) {
    switch (status) {
        case ProbeStatus::Valid: return "valid";
        case ProbeStatus::Invalid: return "invalid";
        case ProbeStatus::ModelNotFound: return "model_not_found";
        case ProbeStatus::Error: return "error";
        default: return "error";
    }
}

namespace ProbeDefaults {
inline constexpr const char* kModel = "gemini-2.5-computer-use-preview-10-2025";
inline constexpr const char* kEndpointTemplate =
    "https://generativelanguage.googleapis.com/v1beta/models/{model}:generateContent";
inline constexpr const char* kResultsFile = "results.csv";
inline constexpr const char* kSuccessFile = "success.txt";
inline constexpr int kConcurrency = 20;
inline constexpr int kTimeoutSeconds = 10;
inline constexpr int kMaxAttempts = 3;
inline constexpr double kInitialBackoffSeconds = 1.0;
inline constexpr double kBackoffFactor = 2.0;
inline constexpr std::size_t kMaxDetailLength = 500;
inline constexpr std::size_t kMaxErrorMessageLength = 300;
} // namespace ProbeDefaults

/// Sentinel http_status values for outcomes without a usable response code.
namespace HttpStatusSentinel {
inline constexpr long kNoResponse = -1;
inline constexpr long kUnexpected = -2;
} // namespace HttpStatusSentinel

struct ProbeResult {
    std::string key;
    ProbeStatus status{ProbeStatus::Error};
    long http_status{HttpStatusSentinel::kNoResponse};
    std::string detail;
    double elapsed_seconds{0.0};
};

/**
 * @brief Retry schedule applied to transient probe failures.
 */
struct RetryPolicy {
    int max_attempts{ProbeDefaults::kMaxAttempts};
    double initial_backoff_seconds{ProbeDefaults::kInitialBackoffSeconds};
    double backoff_factor{ProbeDefaults::kBackoffFactor};
};

#endif
