#include "runner.h"

#include "log.h"

#include <chrono>

namespace swarm {

swarm_runner::swarm_runner(std::function<void()> advance_fn, int64_t tick_ms)
    : advance_fn(std::move(advance_fn)), tick_ms(tick_ms), running(false), ticks(0) {
    if (!this->advance_fn) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "runner needs an advance function");
    }
    if (tick_ms <= 0) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "runner tick must be positive");
    }
}

swarm_runner::~swarm_runner() {
    stop();
}

void swarm_runner::start() {
    if (running.load()) {
        return;
    }

    running.store(true);
    worker_thread = std::thread(&swarm_runner::worker_loop, this);

    LOG_INF("swarm runner started (tick=%lld ms)\n", (long long) tick_ms);
}

void swarm_runner::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running.load()) {
            return;
        }
        running.store(false);
    }
    cv.notify_all();

    if (worker_thread.joinable()) {
        worker_thread.join();
    }

    LOG_INF("swarm runner stopped after %llu ticks\n", (unsigned long long) ticks.load());
}

void swarm_runner::post(std::function<void()> cmd) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running.load()) {
            throw swarm_error(ERROR_TYPE_VALIDATION, "runner is not running");
        }
        commands.push_back(std::move(cmd));
    }
    cv.notify_one();
}

void swarm_runner::drain() {
    std::deque<std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex);
        pending.swap(commands);
    }
    for (auto & cmd : pending) {
        try {
            cmd();
        } catch (const std::exception & e) {
            LOG_ERR("runner command failed: %s\n", e.what());
        }
    }
}

void swarm_runner::worker_loop() {
    while (running.load()) {
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, std::chrono::milliseconds(tick_ms),
                        [this]() { return !commands.empty() || !running.load(); });
        }

        drain();
        if (!running.load()) {
            break;
        }

        try {
            advance_fn();
        } catch (const std::exception & e) {
            LOG_ERR("advance failed: %s\n", e.what());
        }
        ticks++;
    }

    // commands accepted before stop() still run
    drain();
}

} // namespace swarm
