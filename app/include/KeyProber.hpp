#ifndef KEY_PROBER_HPP
#define KEY_PROBER_HPP

#include "GeminiProbeRequest.hpp"
#include "ProbeClassifier.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

class IHttpTransport;
namespace spdlog { class logger; }

/**
 * @brief Tests one API key, retrying rate limits and network failures.
 *
 * Attempts are capped by RetryPolicy::max_attempts. After every retryable
 * attempt except the last, the prober sleeps for the current backoff and then
 * multiplies it by RetryPolicy::backoff_factor.
 */
class KeyProber {
public:
    /// Sleeps for the given duration. Returns false when the wait was cut short by a stop request.
    using SleepFunction = std::function<bool(std::chrono::milliseconds, const std::atomic<bool>&)>;

    KeyProber(IHttpTransport& transport,
              GeminiProbeRequest request,
              RetryPolicy policy = {},
              SleepFunction sleeper = {},
              std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Runs the attempt/backoff loop for @p api_key.
     * @return The final result, or std::nullopt when @p stop_flag was raised
     *         before the key reached a final outcome.
     */
    std::optional<ProbeResult> probe(const std::string& api_key,
                                     const std::atomic<bool>& stop_flag) const;

    const RetryPolicy& policy() const { return policy_; }

    /// Default sleeper: waits in short slices and returns early once @p stop_flag is set.
    static bool interruptible_sleep(std::chrono::milliseconds duration,
                                    const std::atomic<bool>& stop_flag);

private:
    ProbeAttempt attempt_once(const std::string& api_key) const;

    IHttpTransport& transport_;
    GeminiProbeRequest request_;
    RetryPolicy policy_;
    SleepFunction sleeper_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // KEY_PROBER_HPP
