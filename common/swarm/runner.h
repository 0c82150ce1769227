#pragma once

#include "common.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace swarm {

// ============================================================================
// Swarm Runner
// ============================================================================

// Drives a single-threaded core from a real timer. The core is only touched on
// the worker thread: callers post closures that run between ticks and get
// results back through futures.
class swarm_runner {
private:
    std::function<void()> advance_fn;
    int64_t tick_ms;

    std::atomic<bool> running;
    std::thread worker_thread;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> commands;

    std::atomic<uint64_t> ticks;

    void worker_loop();
    void drain();

public:
    explicit swarm_runner(std::function<void()> advance_fn, int64_t tick_ms = 50);
    ~swarm_runner();

    swarm_runner(const swarm_runner &) = delete;
    swarm_runner & operator=(const swarm_runner &) = delete;

    void start();

    // runs the commands still queued, then joins the worker
    void stop();

    bool is_running() const { return running.load(); }
    uint64_t tick_count() const { return ticks.load(); }

    // throws swarm_error(ERROR_TYPE_VALIDATION) when the runner is stopped
    void post(std::function<void()> cmd);

    // Runs fn on the worker thread. Exceptions thrown by fn surface from future::get().
    template<typename F>
    auto call(F fn) -> std::future<decltype(fn())> {
        using result_t = decltype(fn());
        auto task = std::make_shared<std::packaged_task<result_t()>>(std::move(fn));
        std::future<result_t> result = task->get_future();
        post([task]() { (*task)(); });
        return result;
    }
};

} // namespace swarm
