#include "compute_engine.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>

using boost::multiprecision::isfinite;

void validate_request(const ComputeRequest& req)
{
    if (req.width <= 0 || req.height <= 0)
        throw std::invalid_argument("compute request: pixel grid "
            + std::to_string(req.width) + "x" + std::to_string(req.height)
            + " is empty");
    if (req.max_iter <= 0)
        throw std::invalid_argument("compute request: max_iter "
            + std::to_string(req.max_iter) + " is not positive");
    if (!isfinite(req.xmin) || !isfinite(req.xmax)
        || !isfinite(req.ymin) || !isfinite(req.ymax))
        throw std::invalid_argument("compute request: non-finite bounds");
    if (!(req.xmin < req.xmax) || !(req.ymin < req.ymax))
        throw std::invalid_argument("compute request: empty or inverted region ["
            + decimal_to_string(req.xmin) + ", " + decimal_to_string(req.xmax) + "] x ["
            + decimal_to_string(req.ymin) + ", " + decimal_to_string(req.ymax) + "]");
}

ComputeRequest request_for(const ViewState& vs, int width, int height)
{
    const ViewBounds b = derive_bounds(vs, aspect_ratio(width, height));
    ComputeRequest req;
    req.xmin     = b.xmin;
    req.xmax     = b.xmax;
    req.ymin     = b.ymin;
    req.ymax     = b.ymax;
    req.width    = width;
    req.height   = height;
    req.max_iter = vs.max_iter;
    return req;
}

// -----------------------------------------------------------------------
// Constructor: detect AVX, build thread pool
// -----------------------------------------------------------------------
ComputeEngine::ComputeEngine(const EngineConfig& config)
    : cfg(config)
{
    avx_supported = __builtin_cpu_supports("avx");
    avx_active    = cfg.use_avx && avx_supported;

    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    set_thread_count(cfg.thread_count);
}

void ComputeEngine::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
}

// -----------------------------------------------------------------------
// Splits the grid into tiles and dispatches them to the thread pool
// -----------------------------------------------------------------------
void ComputeEngine::run_tiles(const Kernel& kernel, IterationBuffer& buf)
{
    const int W    = buf.width, H = buf.height;
    const int tile = cfg.tile_size > 0 ? cfg.tile_size : 64;

    for (int ty = 0; ty < H; ty += tile) {
        for (int tx = 0; tx < W; tx += tile) {
            const int tw = std::min(tile, W - tx);
            const int th = std::min(tile, H - ty);
            pool->submit([&kernel, &buf, tx, ty, tw, th] {
                std::visit([&](const auto& k) { k.render_tile(buf, tx, ty, tw, th); },
                           kernel);
            });
        }
    }
    pool->wait();
}

IterationBuffer ComputeEngine::compute(const ComputeRequest& req)
{
    return compute(req, select_mode(req.xmin, req.xmax, req.width));
}

IterationBuffer ComputeEngine::compute(const ComputeRequest& req, PrecisionMode mode)
{
    validate_request(req);

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const Kernel kernel = make_kernel(req, mode, cfg, avx_active);

    IterationBuffer buf;
    buf.resize(req.width, req.height);
    run_tiles(kernel, buf);

    last_mode = mode;
    last_perturbation = PerturbationStats{};
    if (const auto* pk = std::get_if<PerturbationKernel>(&kernel)) {
        last_perturbation.orbit_length  = pk->orbit->size();
        last_perturbation.orbit_escaped = pk->orbit->escaped;
        last_perturbation.series_skip   = pk->series.skip;
        last_perturbation.rebases       = pk->counters->rebases.load();
        last_perturbation.fallbacks     = pk->counters->fallbacks.load();
        engine_log()->debug("perturbation: {} rebases, {} direct fallbacks",
                            last_perturbation.rebases, last_perturbation.fallbacks);
    }

    last_compute_ms = std::chrono::duration<double, std::milli>(
                          clock::now() - t0).count();
    engine_log()->debug("compute: {}x{} max_iter {} mode {} in {:.1f} ms",
                        req.width, req.height, req.max_iter,
                        precision_mode_name(mode), last_compute_ms);
    return buf;
}

IterationBuffer ComputeEngine::compute(const std::string& xmin, const std::string& xmax, int width,
                                       const std::string& ymin, const std::string& ymax, int height,
                                       int max_iter)
{
    ComputeRequest req;
    const std::pair<const std::string*, Decimal*> fields[] = {
        { &xmin, &req.xmin }, { &xmax, &req.xmax },
        { &ymin, &req.ymin }, { &ymax, &req.ymax },
    };
    for (const auto& f : fields) {
        if (!parse_decimal(*f.first, *f.second))
            throw std::invalid_argument("compute: '" + *f.first + "' is not a finite number");
    }
    req.width    = width;
    req.height   = height;
    req.max_iter = max_iter;
    return compute(req);
}
