#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "polltask/combinators.hpp"
#include "polltask/deferred_timer_task.hpp"
#include "polltask/error.hpp"
#include "polltask/executor.hpp"
#include "polltask/logger.hpp"

namespace polltask {

    /**
     * @brief Abbreviation for std::chrono::steady_clock
     */
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Blocking version of the work: log, sleep on the calling thread, log
     */
    inline void do_work(int x, Logger& logger, std::chrono::milliseconds delay = std::chrono::milliseconds(500)) {
        logger.info("starting work {} on thread {}", x, std::this_thread::get_id());
        std::this_thread::sleep_for(delay);
        logger.info("work done! {} on thread {}", x, std::this_thread::get_id());
    }

    /**
     * @brief Non-blocking version of the work, to be driven by an Executor
     */
    inline std::unique_ptr<Task> do_work_async(int x, Logger& logger, TaskOptions options = {}) {
        return std::make_unique<DeferredTimerTask>(x, logger, options);
    }

    /**
     * @brief Parse a delay given in whole milliseconds
     *
     * @throws std::invalid_argument for trailing characters or a negative value
     * @throws std::out_of_range if the value does not fit
     */
    inline std::chrono::milliseconds parse_delay(const std::string& text) {
        std::size_t pos = 0;
        long long ms = std::stoll(text, &pos);
        if (pos != text.size()) {
            throw std::invalid_argument("trailing characters in delay");
        }
        if (ms < 0) {
            throw std::invalid_argument("delay must not be negative");
        }
        return std::chrono::milliseconds(ms);
    }

    // The drivers below each return the wall clock time they took.

    inline Clock::duration run_sequential(const std::vector<int>& labels, Logger& logger,
                                          std::chrono::milliseconds delay = std::chrono::milliseconds(500)) {
        auto start = Clock::now();
        for (int x : labels) {
            do_work(x, logger, delay);
        }
        return Clock::now() - start;
    }

    /**
     * @brief One thread per label, each running the blocking work
     *
     * @throws SpawnError if a thread cannot be created; threads already
     *  started are joined first
     */
    inline Clock::duration run_multi_threaded(const std::vector<int>& labels, Logger& logger,
                                              std::chrono::milliseconds delay = std::chrono::milliseconds(500),
                                              const ThreadStarter& starter = start_thread) {
        auto start = Clock::now();
        std::vector<std::thread> threads;
        threads.reserve(labels.size());
        for (int x : labels) {
            try {
                threads.push_back(starter([x, &logger, delay]() { do_work(x, logger, delay); }));
            } catch (const std::system_error& e) {
                for (auto& t : threads) {
                    t.join();
                }
                throw SpawnError(x, e.what());
            }
        }
        for (auto& t : threads) {
            t.join();
        }
        return Clock::now() - start;
    }

    /**
     * @brief Await each task before creating the next
     */
    inline Clock::duration run_async_sequential(const std::vector<int>& labels, Logger& logger,
                                                TaskOptions options = {}) {
        auto start = Clock::now();
        std::vector<TaskFactory> factories;
        factories.reserve(labels.size());
        for (int x : labels) {
            factories.push_back([x, &logger, options]() { return do_work_async(x, logger, options); });
        }
        Sequence seq(std::move(factories));
        Executor executor;
        executor.block_on(seq);
        return Clock::now() - start;
    }

    /**
     * @brief Create every task up front and wait for all of them together
     */
    inline Clock::duration run_async_concurrent(const std::vector<int>& labels, Logger& logger,
                                                TaskOptions options = {}) {
        auto start = Clock::now();
        std::vector<std::unique_ptr<Task>> tasks;
        tasks.reserve(labels.size());
        for (int x : labels) {
            tasks.push_back(do_work_async(x, logger, options));
        }
        WaitAll all(std::move(tasks));
        Executor executor;
        executor.block_on(all);
        return Clock::now() - start;
    }

}
