#pragma once

#include "view_state.hpp"

#include <cstdint>

// Runtime settings shared by ComputeEngine and ComputeScheduler.
struct EngineConfig {
    // --- Parallelism ---
    int  thread_count = 0;      // worker threads; 0 = hardware concurrency
    bool use_avx      = true;   // AND-ed with CPU detection at startup
    int  tile_size    = 64;     // square tile edge handed to one pool task

    // --- Normalization ---
    int           normalization_samples    = 100000;  // values kept before the percentile
    double        normalization_percentile = 99.7;    // (0, 100]; max_val of the display range
    std::uint64_t normalization_seed       = 0x5eed;  // sampling is reproducible per seed

    // --- Perturbation ---
    bool   series_approximation = true;
    double series_threshold     = 1e-12;   // |B_n| * max|dc| bound for the skip
    double glitch_tolerance     = 1e-3;    // rebase when |z| < tol * |Z_n|
    int    max_rebases          = 10000;   // per pixel, then direct evaluation

    // --- Scheduler ---
    int       viewport_width  = 800;
    int       viewport_height = 600;
    ViewState initial_view;               // center -0.5+0i, zoom 1, 512 iterations
};
