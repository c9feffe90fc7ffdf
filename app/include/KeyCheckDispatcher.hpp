#ifndef KEY_CHECK_DISPATCHER_HPP
#define KEY_CHECK_DISPATCHER_HPP

#include "Types.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

class KeyProber;
namespace spdlog { class logger; }

struct ProgressEvent {
    std::size_t completed{0};  ///< 1-based position in completion order.
    std::size_t total{0};
    const ProbeResult& result;
};

struct DispatchReport {
    std::vector<ProbeResult> results;  ///< Completion order.
    std::set<std::string> valid_keys;
    bool interrupted{false};
};

/**
 * @brief Probes every key on a fixed pool of worker threads.
 *
 * The pool has min(concurrency, keys.size()) workers, each handling one key
 * at a time, so no more than @c concurrency requests are ever in flight.
 */
class KeyCheckDispatcher {
public:
    using ProgressCallback = std::function<void(const ProgressEvent&)>;

    KeyCheckDispatcher(const KeyProber& prober,
                       std::shared_ptr<spdlog::logger> core_logger);

    DispatchReport run(const std::vector<std::string>& keys,
                       int concurrency,
                       std::atomic<bool>& stop_flag,
                       const ProgressCallback& progress_callback) const;

private:
    struct RunState;
    void worker_loop(RunState& state) const;

    const KeyProber& prober;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
