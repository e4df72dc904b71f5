#pragma once

#include <functional>
#include <utility>

namespace polltask {

    /**
     * @brief Result of polling a task once
     */
    enum class Poll {
        Pending,
        Ready
    };

    /**
     * @brief Handle a pending task uses to ask its scheduler to poll it again
     *
     * A default constructed waker does nothing when woken.
     */
    class Waker {
        public:
        Waker() = default;

        /**
         * @brief Construct a new Waker object
         *
         * @param fn callback run on every wake, possibly from another thread.
         *  If it throws on a timer thread the task rethrows from its next poll.
         */
        explicit Waker(std::function<void()> fn);

        /**
         * @brief Request another poll
         */
        inline void wake() const;

        inline bool valid() const noexcept;

        private:
        std::function<void()> fn;
    };

    /**
     * @brief A unit of work driven to completion by repeated polling
     */
    class Task {
        public:
        virtual ~Task() = default;

        /**
         * @brief Advance the task without blocking
         *
         * @param waker handle to request another poll
         * @return Poll::Ready once the task has finished
         */
        virtual Poll poll(const Waker& waker) = 0;
    };

    // Waker definitions
    inline Waker::Waker(std::function<void()> fn) : fn(std::move(fn)) {}

    void Waker::wake() const {
        if (fn) {
            fn();
        }
    }

    bool Waker::valid() const noexcept {
        return static_cast<bool>(fn);
    }

}
