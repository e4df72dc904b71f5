#include "polltask.hpp"

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

// Runs the same four units of simulated work under each model of
// computation. Run it a few times to see the start/done messages reorder.

namespace {

    void report(const char* name, polltask::Clock::duration elapsed) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        std::printf("%s took %lld ms\n", name, static_cast<long long>(ms));
    }

    void usage() {
        std::fprintf(stderr, "usage: work_models [sequential|threads|async-seq|async-concurrent|all] [delay_ms]\n");
    }

}

int main(int argc, char** argv) {
    std::string mode = argc > 1 ? argv[1] : "all";
    std::chrono::milliseconds delay{500};

    if (argc > 2) {
        try {
            delay = polltask::parse_delay(argv[2]);
        } catch (const std::logic_error& e) {
            std::fprintf(stderr, "invalid delay '%s': %s\n", argv[2], e.what());
            usage();
            return 1;
        }
    }

    if (mode != "all" && mode != "sequential" && mode != "threads" && mode != "async-seq" && mode != "async-concurrent") {
        std::fprintf(stderr, "unknown mode '%s'\n", mode.c_str());
        usage();
        return 1;
    }

    polltask::StreamLogger logger;
    const std::vector<int> labels{1, 2, 3, 4};
    polltask::TaskOptions options;
    options.delay = delay;

    try {
        if (mode == "all" || mode == "sequential") {
            report("sequential", polltask::run_sequential(labels, logger, delay));
        }
        if (mode == "all" || mode == "threads") {
            report("multi threaded", polltask::run_multi_threaded(labels, logger, delay));
        }
        if (mode == "all" || mode == "async-seq") {
            report("async sequential", polltask::run_async_sequential(labels, logger, options));
        }
        if (mode == "all" || mode == "async-concurrent") {
            report("async concurrent", polltask::run_async_concurrent(labels, logger, options));
        }
    } catch (const polltask::exception& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    return 0;
}
