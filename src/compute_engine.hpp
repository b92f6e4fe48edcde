#pragma once

#include "engine_config.hpp"
#include "iteration_buffer.hpp"
#include "kernels.hpp"
#include "precision.hpp"
#include "thread_pool.hpp"
#include "view_state.hpp"

#include <memory>
#include <string>

// Counters of the last Perturbation pass.
struct PerturbationStats {
    int       orbit_length  = 0;
    bool      orbit_escaped = false;
    int       series_skip   = 0;
    long long rebases       = 0;
    long long fallbacks     = 0;   // pixels evaluated directly in Decimal
};

// Throws std::invalid_argument unless xmin < xmax, ymin < ymax (all finite)
// and width, height, max_iter are positive.
void validate_request(const ComputeRequest& req);

// Request covering the viewport of `vs` at width x height pixels.
ComputeRequest request_for(const ViewState& vs, int width, int height);

// Tiled escape-time engine. Not thread safe: one caller at a time.
class ComputeEngine {
public:
    explicit ComputeEngine(const EngineConfig& cfg = EngineConfig{});

    // Runs the mode chosen by select_mode().
    IterationBuffer compute(const ComputeRequest& req);
    IterationBuffer compute(const ComputeRequest& req, PrecisionMode mode);

    // Bounds as decimal strings, kept exact until the kernel binds them.
    // Throws std::invalid_argument for text that is not a finite number.
    IterationBuffer compute(const std::string& xmin, const std::string& xmax, int width,
                            const std::string& ymin, const std::string& ymax, int height,
                            int max_iter);

    const EngineConfig& config() const { return cfg; }

    double            last_compute_ms = 0.0;
    PrecisionMode     last_mode       = PrecisionMode::Double;
    PerturbationStats last_perturbation;
    bool avx_active     = false;   // true if the AVX double path is in use
    int  thread_count   = 0;
    int  hw_concurrency = 0;       // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    // Override AVX flag (e.g. for benchmarking the scalar path); ignored
    // on CPUs without AVX
    void set_avx(bool b) { avx_active = b && avx_supported; }

private:
    void run_tiles(const Kernel& kernel, IterationBuffer& buf);

    EngineConfig                cfg;
    std::unique_ptr<ThreadPool> pool;
    bool                        avx_supported = false;
};
