#include "KeyCheckDispatcher.hpp"
#include "KeyProber.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <thread>

struct KeyCheckDispatcher::RunState {
    const std::vector<std::string>& keys;
    std::atomic<bool>& stop_flag;
    const ProgressCallback& progress_callback;
    std::atomic<std::size_t> next_index{0};
    std::mutex results_mutex;
    DispatchReport report;
};


KeyCheckDispatcher::KeyCheckDispatcher(const KeyProber& prober,
                                       std::shared_ptr<spdlog::logger> core_logger)
    : prober(prober),
      core_logger(std::move(core_logger))
{
}


DispatchReport KeyCheckDispatcher::run(const std::vector<std::string>& keys,
                                       int concurrency,
                                       std::atomic<bool>& stop_flag,
                                       const ProgressCallback& progress_callback) const
{
    RunState state{keys, stop_flag, progress_callback};
    if (keys.empty()) {
        return std::move(state.report);
    }

    const std::size_t worker_count =
        std::min<std::size_t>(static_cast<std::size_t>(std::max(concurrency, 1)), keys.size());
    state.report.results.reserve(keys.size());

    if (core_logger) {
        core_logger->info("Probing {} key(s) with {} worker(s)", keys.size(), worker_count);
    }

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back([this, &state]() { worker_loop(state); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    state.report.interrupted = stop_flag.load() && state.report.results.size() < keys.size();

    if (core_logger) {
        if (state.report.interrupted) {
            core_logger->warn("Run interrupted after {} of {} key(s)",
                              state.report.results.size(), keys.size());
        } else {
            core_logger->info("Probed {} key(s), {} valid",
                              state.report.results.size(), state.report.valid_keys.size());
        }
    }

    return std::move(state.report);
}


void KeyCheckDispatcher::worker_loop(RunState& state) const
{
    const std::size_t total = state.keys.size();

    while (!state.stop_flag.load()) {
        const std::size_t index = state.next_index.fetch_add(1);
        if (index >= total) {
            return;
        }

        std::optional<ProbeResult> result = prober.probe(state.keys[index], state.stop_flag);
        if (!result) {
            return;
        }

        std::lock_guard<std::mutex> lock(state.results_mutex);
        if (result->status == ProbeStatus::Valid) {
            state.report.valid_keys.insert(result->key);
        }
        state.report.results.push_back(std::move(*result));

        if (state.progress_callback) {
            try {
                state.progress_callback(ProgressEvent{state.report.results.size(), total,
                                                      state.report.results.back()});
            } catch (const std::exception& ex) {
                if (core_logger) {
                    core_logger->error("Progress callback failed: {}", ex.what());
                }
            }
        }
    }
}
