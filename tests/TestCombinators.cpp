#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

#include "RecordingLogger.h"
#include "polltask/combinators.hpp"
#include "polltask/executor.hpp"
#include "polltask/work.hpp"

using namespace std::chrono_literals;
using polltask::Executor;
using polltask::Poll;
using polltask::Sequence;
using polltask::Task;
using polltask::TaskFactory;
using polltask::WaitAll;
using polltask::Waker;

namespace {
    struct CountdownTask : Task {
        explicit CountdownTask(int n) : left(n) {}

        Poll poll(Waker const &waker) override {
            if (left-- <= 0) {
                return Poll::Ready;
            }
            waker.wake();
            return Poll::Pending;
        }

        int left;
    };

    polltask::TaskOptions with_delay(std::chrono::milliseconds delay) {
        polltask::TaskOptions options;
        options.delay = delay;
        return options;
    }
}

TEST(sequence, empty_is_ready) {
    Sequence seq(std::vector<TaskFactory>{});
    ASSERT_EQ(seq.poll(Waker()), Poll::Ready);
    ASSERT_EQ(seq.completed(), 0u);
}

TEST(sequence, null_factory) {
    std::vector<TaskFactory> factories(1);
    ASSERT_THROW(Sequence seq(std::move(factories)), std::invalid_argument);
}

TEST(sequence, factory_returns_null) {
    Sequence seq(std::vector<TaskFactory>{[] { return std::unique_ptr<Task>(); }});
    ASSERT_THROW(seq.poll(Waker()), std::runtime_error);
}

TEST(sequence, creates_tasks_lazily) {
    int created = 0;
    std::vector<TaskFactory> factories;
    for (int i = 0; i < 3; ++i) {
        factories.push_back([&created] {
            created++;
            return std::unique_ptr<Task>(new CountdownTask(1));
        });
    }
    Sequence seq(std::move(factories));

    ASSERT_EQ(seq.poll(Waker()), Poll::Pending);
    ASSERT_EQ(created, 1);
    ASSERT_EQ(seq.poll(Waker()), Poll::Pending);
    ASSERT_EQ(created, 2);
    ASSERT_EQ(seq.completed(), 1u);
    ASSERT_EQ(seq.poll(Waker()), Poll::Pending);
    ASSERT_EQ(created, 3);
    ASSERT_EQ(seq.poll(Waker()), Poll::Ready);
    ASSERT_EQ(seq.completed(), 3u);
}

TEST(sequence, timers_do_not_overlap) {
    RecordingLogger logger;
    std::vector<TaskFactory> factories;
    for (int x = 1; x <= 3; ++x) {
        factories.push_back([x, &logger] { return polltask::do_work_async(x, logger, with_delay(50ms)); });
    }
    Sequence seq(std::move(factories));
    Executor executor;
    auto start = std::chrono::steady_clock::now();
    executor.block_on(seq);
    ASSERT_GE(std::chrono::steady_clock::now() - start, 150ms);

    auto messages = logger.messages();
    ASSERT_EQ(messages.size(), 6u);
    for (size_t i = 0; i < messages.size(); i += 2) {
        ASSERT_EQ(messages[i].rfind("starting work", 0), 0u);
        ASSERT_EQ(messages[i + 1].rfind("work done!", 0), 0u);
    }
}

TEST(wait_all, empty_is_ready) {
    WaitAll all(std::vector<std::unique_ptr<Task>>{});
    ASSERT_EQ(all.poll(Waker()), Poll::Ready);
}

TEST(wait_all, null_task) {
    std::vector<std::unique_ptr<Task>> tasks;
    tasks.push_back(nullptr);
    ASSERT_THROW(WaitAll all(std::move(tasks)), std::invalid_argument);
}

TEST(wait_all, ready_when_slowest_is_ready) {
    std::vector<std::unique_ptr<Task>> tasks;
    tasks.push_back(std::make_unique<CountdownTask>(0));
    tasks.push_back(std::make_unique<CountdownTask>(2));
    tasks.push_back(std::make_unique<CountdownTask>(1));
    WaitAll all(std::move(tasks));

    ASSERT_EQ(all.poll(Waker()), Poll::Pending);
    ASSERT_EQ(all.remaining(), 2u);
    ASSERT_EQ(all.poll(Waker()), Poll::Pending);
    ASSERT_EQ(all.remaining(), 1u);
    ASSERT_EQ(all.poll(Waker()), Poll::Ready);
    ASSERT_EQ(all.remaining(), 0u);
}

TEST(wait_all, finished_children_not_polled_again) {
    RecordingLogger logger;
    std::vector<std::unique_ptr<Task>> tasks;
    for (int x = 1; x <= 4; ++x) {
        tasks.push_back(polltask::do_work_async(x, logger, with_delay(30ms)));
    }
    WaitAll all(std::move(tasks));
    Executor executor;
    executor.block_on(all);
    ASSERT_EQ(logger.count_containing("work done!"), 4u);
    ASSERT_EQ(all.poll(Waker()), Poll::Ready);
    ASSERT_EQ(logger.count_containing("work done!"), 4u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
