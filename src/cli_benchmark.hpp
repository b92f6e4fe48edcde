#pragma once

#include "compute_engine.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

// Horizontal span `span` around (cx, cy); the vertical span follows the
// pixel aspect.
inline ComputeRequest bench_region(const char* cx, const char* cy, const char* span,
                                   int w, int h, int max_iter)
{
    const Decimal x(cx), y(cy), sx(span);
    const Decimal sy = sx * h / w;
    ComputeRequest req;
    req.xmin     = x - sx / 2;
    req.xmax     = x + sx / 2;
    req.ymin     = y - sy / 2;
    req.ymax     = y + sy / 2;
    req.width    = w;
    req.height   = h;
    req.max_iter = max_iter;
    return req;
}

inline int run_cli_benchmark(int threads)
{
    EngineConfig cfg;
    cfg.thread_count = threads;
    ComputeEngine engine(cfg);

    constexpr int RUNS = 4, BEST_N = 2;

    struct TestCase {
        const char* label;
        const char* cx;
        const char* cy;
        const char* span;
        int         w, h, max_iter;
        bool        force_scalar;
    };

    const TestCase tests[] = {
        {"Full set",          "-0.5",               "0",                 "3.5",   640, 360,  256, false},
        {"Full set",          "-0.5",               "0",                 "3.5",   640, 360,  256, true },
        {"Seahorse 1e-13",    "-0.743643887037151", "0.13182590420533",  "1e-13", 320, 180, 1024, false},
        {"Seahorse 1e-25",    "-0.743643887037151", "0.13182590420533",  "1e-25", 160,  90, 1024, false},
        {"Misiurewicz 1e-40", "0",                  "1",                 "1e-40", 320, 180, 1000, false},
    };

    printf("deepzoom CLI Benchmark\n");
    printf("%d thread(s), %d runs (avg best %d)\n", engine.thread_count, RUNS, BEST_N);
    printf("AVX supported: %s\n\n", engine.avx_active ? "yes" : "no");
    printf("%-22s %-9s %-14s %-8s %s\n", "Label", "Size", "Mode", "Path", "Mpix/s");
    printf("----------------------------------------------------------------\n");

    const bool has_avx = engine.avx_active;

    for (const auto& t : tests) {
        const ComputeRequest req = bench_region(t.cx, t.cy, t.span, t.w, t.h, t.max_iter);
        engine.set_avx(t.force_scalar ? false : has_avx);

        // Warm-up
        engine.compute(req);

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            engine.compute(req);
            times[r] = engine.last_compute_ms;
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        const double mpixs = (t.w * t.h) / (avg_ms * 1000.0);

        const char* path_label = "scalar";
        if (engine.last_mode == PrecisionMode::Double && engine.avx_active)
            path_label = "AVX";
        else if (engine.last_mode == PrecisionMode::Perturbation)
            path_label = "delta";

        char size[16];
        snprintf(size, sizeof(size), "%dx%d", t.w, t.h);
        printf("%-22s %-9s %-14s %-8s %8.3f\n", t.label, size,
               precision_mode_name(engine.last_mode), path_label, mpixs);
    }

    engine.set_avx(has_avx);  // restore
    return 0;
}
