#include "polltask.hpp"

#include <cstdio>

int main() {

    polltask::StreamLogger logger;

    // Same four tasks, once per wake policy, to compare how often each gets polled.
    for (auto policy : {polltask::WakePolicy::Eager, polltask::WakePolicy::Notify}) {
        polltask::Executor executor;
        polltask::TaskOptions options;
        options.wake = policy;

        for (int x = 1; x <= 4; x++) {
            executor.spawn(polltask::do_work_async(x, logger, options));
        }
        executor.run();

        std::printf("%s: %zu polls\n", policy == polltask::WakePolicy::Eager ? "eager" : "notify", executor.polls());
    }

    return 0;
}
