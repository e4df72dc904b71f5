#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include "polltask/error.hpp"
#include "polltask/logger.hpp"
#include "polltask/poll.hpp"

namespace polltask {

    /**
     * @brief How a pending DeferredTimerTask gets its next poll
     */
    enum class WakePolicy {
        /** Every Pending poll wakes the caller straight away (busy polling) */
        Eager,
        /** Poll only records the waker; the timer thread wakes it once when it fires */
        Notify
    };

    /**
     * @brief Starts a thread running the given body
     *
     * Throws std::system_error when no thread can be created, like the
     * std::thread constructor.
     */
    using ThreadStarter = std::function<std::thread(std::function<void()>)>;

    inline std::thread start_thread(std::function<void()> body) {
        return std::thread(std::move(body));
    }

    struct TaskOptions {
        std::chrono::milliseconds delay{500};
        WakePolicy wake = WakePolicy::Eager;
        /** Empty means start_thread */
        ThreadStarter starter;
    };

    /**
     * @brief Simulated long running work that completes when a background timer fires
     *
     * The wait happens on a detached thread so the polling thread never blocks.
     * There is no cancellation: destroying the task leaves the timer running
     * until it expires.
     */
    class DeferredTimerTask : public Task {
        public:

        /**
         * @brief Construct a new Deferred Timer Task object and start its timer
         *
         * @param x label used in diagnostics
         * @param logger destination of the start and done messages, must outlive the task
         * @param options timer delay, wake policy and thread starter
         * @throws SpawnError if the timer thread cannot be started
         */
        DeferredTimerTask(int x, Logger& logger, TaskOptions options = {});

        DeferredTimerTask(const DeferredTimerTask& other) = delete;
        DeferredTimerTask& operator=(const DeferredTimerTask& other) = delete;

        /**
         * @brief Report whether the timer has fired
         *
         * The first Ready result logs the done message, later polls return
         * Ready without logging again. In Notify mode an exception thrown by
         * the waker on the timer thread is rethrown here, once.
         */
        Poll poll(const Waker& waker) override;

        /**
         * @brief Check the readiness flag without polling
         */
        inline bool ready() const noexcept;

        inline int label() const noexcept;

        inline const TaskOptions& options() const noexcept;

        private:

        /**
         * @brief Waker handed from the poller to the timer thread in Notify mode
         */
        class WakerSlot {
            public:
            inline void store(const Waker& waker);
            inline void fire();
            inline void rethrow_wake_error();

            private:
            std::mutex mutex;
            Waker waker;
            bool fired = false;
            std::exception_ptr wake_error;
        };

        inline void start_timer();

        int x;
        Logger& logger;
        TaskOptions opts;
        std::shared_ptr<std::atomic<bool>> flag;
        std::shared_ptr<WakerSlot> slot;
        bool reported = false;
    };

    // DeferredTimerTask definitions
    inline DeferredTimerTask::DeferredTimerTask(int x, Logger& logger, TaskOptions options)
        : x(x), logger(logger), opts(options), flag(std::make_shared<std::atomic<bool>>(false)) {
        if (opts.wake == WakePolicy::Notify) {
            slot = std::make_shared<WakerSlot>();
        }
        logger.info("starting work {} on thread {}", x, std::this_thread::get_id());
        start_timer();
    }

    void DeferredTimerTask::start_timer() {
        auto timeout_flag = flag;
        auto timeout_slot = slot;
        auto delay = opts.delay;
        auto body = [timeout_flag, timeout_slot, delay]() {
            std::this_thread::sleep_for(delay);
            timeout_flag->store(true, std::memory_order_seq_cst);
            if (timeout_slot) {
                timeout_slot->fire();
            }
        };
        try {
            std::thread timer = opts.starter ? opts.starter(body) : start_thread(body);
            timer.detach();
        } catch (const std::system_error& e) {
            logger.error("cannot start timer for work {}: {}", x, e.what());
            throw SpawnError(x, e.what());
        }
    }

    inline Poll DeferredTimerTask::poll(const Waker& waker) {
        if (slot) {
            slot->rethrow_wake_error();
            // Register before reading the flag so a timer firing in between still wakes us.
            slot->store(waker);
        }

        if (flag->load(std::memory_order_seq_cst)) {
            if (!reported) {
                reported = true;
                logger.info("work done! {} on thread {}", x, std::this_thread::get_id());
            }
            return Poll::Ready;
        }

        if (!slot) {
            waker.wake();
        }
        return Poll::Pending;
    }

    bool DeferredTimerTask::ready() const noexcept {
        return flag->load(std::memory_order_seq_cst);
    }

    int DeferredTimerTask::label() const noexcept {
        return x;
    }

    const TaskOptions& DeferredTimerTask::options() const noexcept {
        return opts;
    }

    // WakerSlot definitions
    void DeferredTimerTask::WakerSlot::store(const Waker& w) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!fired) {
            waker = w;
        }
    }

    void DeferredTimerTask::WakerSlot::fire() {
        Waker pending;
        {
            std::lock_guard<std::mutex> lock(mutex);
            fired = true;
            pending = std::move(waker);
            waker = Waker();
        }
        // Nothing on the timer thread can handle the error, hand it to the poller.
        try {
            pending.wake();
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex);
            wake_error = std::current_exception();
        }
    }

    void DeferredTimerTask::WakerSlot::rethrow_wake_error() {
        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(mutex);
            error = std::exchange(wake_error, nullptr);
        }
        if (error) {
            std::rethrow_exception(error);
        }
    }

}
