#include "cli_benchmark.hpp"
#include "log.hpp"

#include <spdlog/cfg/env.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>

static void print_usage(const char* argv0)
{
    fprintf(stderr,
            "usage: %s [--threads N]\n"
            "  --threads N   worker threads (default 1, 0 = all cores)\n"
            "Log level follows SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=debug).\n",
            argv0);
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    spdlog::cfg::load_env_levels();

    int threads = 1;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
            char* end = nullptr;
            const long n = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || n < 0) {
                fprintf(stderr, "invalid thread count: %s\n", argv[i]);
                return 1;
            }
            threads = static_cast<int>(n);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        return run_cli_benchmark(threads);
    } catch (const std::exception& e) {
        engine_log()->error("benchmark failed: {}", e.what());
        return 1;
    }
}
