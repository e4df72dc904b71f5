#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "polltask/poll.hpp"

namespace polltask {

    /**
     * @brief Deferred constructor of a task
     */
    using TaskFactory = std::function<std::unique_ptr<Task>()>;

    /**
     * @brief Runs tasks one after another
     *
     * Each task is only created once its predecessor is Ready, so work that
     * starts in a constructor (like a timer) does not overlap.
     */
    class Sequence : public Task {
        public:
        explicit Sequence(std::vector<TaskFactory> factories);

        Poll poll(const Waker& waker) override;

        /**
         * @brief Number of tasks that have completed so far
         */
        inline std::size_t completed() const noexcept;

        private:
        std::vector<TaskFactory> factories;
        std::unique_ptr<Task> current;
        std::size_t next = 0;
        std::size_t done = 0;
    };

    /**
     * @brief Polls a set of tasks together, Ready when all of them are
     */
    class WaitAll : public Task {
        public:
        explicit WaitAll(std::vector<std::unique_ptr<Task>> tasks);

        Poll poll(const Waker& waker) override;

        inline std::size_t remaining() const noexcept;

        private:
        std::vector<std::unique_ptr<Task>> tasks;
        std::size_t left;
    };

    // Sequence definitions
    inline Sequence::Sequence(std::vector<TaskFactory> factories) : factories(std::move(factories)) {
        for (const auto& f : this->factories) {
            if (!f) {
                throw std::invalid_argument("Sequence requires non-empty task factories");
            }
        }
    }

    inline Poll Sequence::poll(const Waker& waker) {
        for (;;) {
            if (!current) {
                if (next == factories.size()) {
                    return Poll::Ready;
                }
                current = factories[next++]();
                if (!current) {
                    throw std::runtime_error("Task factory returned a null task");
                }
            }
            if (current->poll(waker) == Poll::Pending) {
                return Poll::Pending;
            }
            current.reset();
            ++done;
        }
    }

    std::size_t Sequence::completed() const noexcept {
        return done;
    }

    // WaitAll definitions
    inline WaitAll::WaitAll(std::vector<std::unique_ptr<Task>> tasks) : tasks(std::move(tasks)) {
        for (const auto& t : this->tasks) {
            if (!t) {
                throw std::invalid_argument("WaitAll requires non-null tasks");
            }
        }
        left = this->tasks.size();
    }

    inline Poll WaitAll::poll(const Waker& waker) {
        for (auto& t : tasks) {
            if (t && t->poll(waker) == Poll::Ready) {
                t.reset();
                --left;
            }
        }
        return left == 0 ? Poll::Ready : Poll::Pending;
    }

    std::size_t WaitAll::remaining() const noexcept {
        return left;
    }

}
