#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>

#include "polltask/poll.hpp"

namespace polltask {

    using TaskId = std::size_t;

    /**
     * @brief Queue of task ids waiting to be polled
     *
     * Pushed to by wakers from any thread, drained by the scheduling thread.
     * An id already queued is not queued twice.
     */
    class RunQueue {
        public:
        inline void push(TaskId id);

        /**
         * @brief Block until an id is queued and remove it
         */
        inline TaskId wait_pop();

        inline bool empty() const;

        private:
        std::deque<TaskId> ids;
        std::set<TaskId> queued;
        mutable std::mutex mutex;
        std::condition_variable condition;
    };

    /**
     * @brief Single threaded cooperative executor
     *
     * Tasks are only polled on the thread calling run() or block_on(). A
     * pending task is polled again once its waker fires; until then the
     * executor sleeps instead of spinning.
     */
    class Executor {
        public:
        Executor();

        Executor(const Executor& other) = delete;
        Executor& operator=(const Executor& other) = delete;

        /**
         * @brief Hand a task to the executor and queue its first poll
         *
         * Must be called from the scheduling thread.
         *
         * @param task task to drive, not null
         * @return TaskId id used by the task's waker
         */
        TaskId spawn(std::unique_ptr<Task> task);

        /**
         * @brief Poll spawned tasks until every one of them is Ready
         *
         * An exception thrown by a poll drops that task and propagates.
         */
        void run();

        /**
         * @brief Drive a single task to completion on the calling thread
         *
         * @param task task to drive, borrowed for the duration of the call
         */
        void block_on(Task& task);

        /**
         * @brief Number of spawned tasks that have not completed
         */
        inline std::size_t pending() const noexcept;

        /**
         * @brief Total number of polls performed by this executor
         */
        inline std::size_t polls() const noexcept;

        private:
        static inline Waker make_waker(const std::shared_ptr<RunQueue>& queue, TaskId id);

        std::shared_ptr<RunQueue> queue;
        std::map<TaskId, std::unique_ptr<Task>> tasks;
        TaskId next_id = 0;
        std::size_t poll_count = 0;
    };

    // RunQueue definitions
    void RunQueue::push(TaskId id) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!queued.insert(id).second) {
                return;
            }
            ids.push_back(id);
        }
        condition.notify_one();
    }

    TaskId RunQueue::wait_pop() {
        std::unique_lock<std::mutex> lock(mutex);
        condition.wait(lock, [this] { return !ids.empty(); });
        TaskId id = ids.front();
        ids.pop_front();
        queued.erase(id);
        return id;
    }

    bool RunQueue::empty() const {
        std::lock_guard<std::mutex> lock(mutex);
        return ids.empty();
    }

    // Executor definitions
    inline Executor::Executor() : queue(std::make_shared<RunQueue>()) {}

    inline TaskId Executor::spawn(std::unique_ptr<Task> task) {
        if (!task) {
            throw std::invalid_argument("Cannot spawn a null task");
        }
        TaskId id = next_id++;
        tasks.emplace(id, std::move(task));
        queue->push(id);
        return id;
    }

    inline void Executor::run() {
        while (!tasks.empty()) {
            TaskId id = queue->wait_pop();
            auto it = tasks.find(id);
            if (it == tasks.end()) {
                // late wake for a finished task
                continue;
            }

            Poll result;
            try {
                ++poll_count;
                result = it->second->poll(make_waker(queue, id));
            } catch (...) {
                tasks.erase(it);
                throw;
            }

            if (result == Poll::Ready) {
                tasks.erase(it);
            }
        }
    }

    inline void Executor::block_on(Task& task) {
        // A private queue keeps wakes for spawned tasks out of this loop.
        auto local = std::make_shared<RunQueue>();
        Waker waker = make_waker(local, 0);
        local->push(0);
        for (;;) {
            local->wait_pop();
            ++poll_count;
            if (task.poll(waker) == Poll::Ready) {
                return;
            }
        }
    }

    std::size_t Executor::pending() const noexcept {
        return tasks.size();
    }

    std::size_t Executor::polls() const noexcept {
        return poll_count;
    }

    Waker Executor::make_waker(const std::shared_ptr<RunQueue>& queue, TaskId id) {
        std::weak_ptr<RunQueue> weak = queue;
        return Waker([weak, id]() {
            // The timer thread may outlive the executor.
            if (auto q = weak.lock()) {
                q->push(id);
            }
        });
    }

}
