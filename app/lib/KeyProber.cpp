#include "KeyProber.hpp"
#include "IHttpTransport.hpp"
#include "TransportErrors.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace {
constexpr std::chrono::milliseconds kSleepSlice{50};
constexpr double kMaxBackoffSeconds = 3600.0;

// Clamped to [0, kMaxBackoffSeconds]; NaN maps to zero.
std::chrono::milliseconds seconds_to_ms(double seconds)
{
    const double bounded = std::min(std::max(0.0, seconds), kMaxBackoffSeconds);
    return std::chrono::milliseconds(static_cast<long long>(bounded * 1000.0 + 0.5));
}
}


KeyProber::KeyProber(IHttpTransport& transport,
                     GeminiProbeRequest request,
                     RetryPolicy policy,
                     SleepFunction sleeper,
                     std::shared_ptr<spdlog::logger> logger)
    : transport_(transport),
      request_(std::move(request)),
      policy_(policy),
      sleeper_(sleeper ? std::move(sleeper) : SleepFunction(&KeyProber::interruptible_sleep)),
      logger_(std::move(logger))
{
    if (policy_.max_attempts < 1) {
        policy_.max_attempts = 1;
    }
}


bool KeyProber::interruptible_sleep(std::chrono::milliseconds duration,
                                    const std::atomic<bool>& stop_flag)
{
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop_flag.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kSleepSlice));
    }
    return false;
}


ProbeAttempt KeyProber::attempt_once(const std::string& api_key) const
{
    try {
        HttpResponse response = transport_.post(request_.build_for_key(api_key));
        return ProbeAttempt::response(response.status, std::move(response.body));
    } catch (const TransportAbortedError&) {
        return ProbeAttempt::aborted();
    } catch (const TransportTimeoutError&) {
        return ProbeAttempt::timeout();
    } catch (const TransportError& ex) {
        return ProbeAttempt::transport_failure(ex.what());
    } catch (const std::exception& ex) {
        return ProbeAttempt::unexpected(ex.what());
    }
}


std::optional<ProbeResult> KeyProber::probe(const std::string& api_key,
                                            const std::atomic<bool>& stop_flag) const
{
    const auto start = std::chrono::steady_clock::now();
    double backoff_seconds = policy_.initial_backoff_seconds;
    Classification outcome;

    for (int attempt = 1; ; ++attempt) {
        if (stop_flag.load()) {
            return std::nullopt;
        }

        const ProbeAttempt result = attempt_once(api_key);
        if (result.kind == ProbeAttempt::Kind::Aborted && stop_flag.load()) {
            return std::nullopt;
        }

        outcome = ProbeClassifier::classify(result);
        if (!outcome.retryable || attempt >= policy_.max_attempts) {
            break;
        }

        if (logger_) {
            logger_->debug("Key {} attempt {}/{} returned {} ({}); retrying in {:.2f}s",
                           Utils::mask_key(api_key), attempt, policy_.max_attempts,
                           outcome.http_status, outcome.detail, backoff_seconds);
        }

        if (!sleeper_(seconds_to_ms(backoff_seconds), stop_flag)) {
            return std::nullopt;
        }
        backoff_seconds = std::min(backoff_seconds * policy_.backoff_factor, kMaxBackoffSeconds);
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    ProbeResult probe_result;
    probe_result.key = api_key;
    probe_result.status = outcome.status;
    probe_result.http_status = outcome.http_status;
    probe_result.detail = std::move(outcome.detail);
    probe_result.elapsed_seconds = Utils::round_to_hundredths(elapsed.count());
    return probe_result;
}
