#pragma once

#include <stdexcept>
#include <string>

namespace polltask {

    /**
     * @brief Base class of the errors raised by polltask
     */
    class exception : public std::runtime_error {
        public:
        explicit exception(const std::string& msg) : std::runtime_error(msg) {}
    };

    /**
     * @brief The background timer thread of a task could not be started
     */
    class SpawnError : public exception {
        public:
        SpawnError(int label, const std::string& reason)
            : exception("cannot start timer for work " + std::to_string(label) + ": " + reason), label_(label) {}

        int label() const noexcept { return label_; }

        private:
        int label_;
    };

}
