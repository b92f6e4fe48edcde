#include "compute_scheduler.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

ComputeScheduler::ComputeScheduler(const EngineConfig& config)
    : cfg(config)
    , engine(std::make_unique<ComputeEngine>(config))
{
    ComputeEngine* e = engine.get();
    backend = [e](const ComputeRequest& req, PrecisionMode mode) {
        return e->compute(req, mode);
    };
    start();
}

ComputeScheduler::ComputeScheduler(const EngineConfig& config, ComputeBackend b)
    : cfg(config)
    , backend(std::move(b))
{
    if (!backend) throw std::invalid_argument("ComputeScheduler: empty backend");
    start();
}

ComputeScheduler::~ComputeScheduler()
{
    stop();
}

void ComputeScheduler::start()
{
    live          = cfg.initial_view;
    live_viewport = Viewport{ std::max(cfg.viewport_width, 1),
                              std::max(cfg.viewport_height, 1) };
    worker = std::thread([this] { worker_loop(); });
}

void ComputeScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
    }
    cv_work.notify_all();
    if (worker.joinable()) worker.join();
    cv_idle.notify_all();
}

// -----------------------------------------------------------------------
// Interactive side
// -----------------------------------------------------------------------
bool ComputeScheduler::post(const ViewCommand& cmd)
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!apply_command(live, live_viewport, cfg.initial_view, cmd)) return false;
        dirty = true;
    }
    cv_work.notify_one();
    return true;
}

ViewState ComputeScheduler::view() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return live;
}

Viewport ComputeScheduler::viewport() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return live_viewport;
}

std::shared_ptr<const ComputeResult> ComputeScheduler::latest() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return published;
}

Frame ComputeScheduler::frame() const
{
    Frame f;
    {
        std::lock_guard<std::mutex> lock(mtx);
        f.result   = published;
        f.live     = live;
        f.viewport = live_viewport;
    }
    if (f.result) {
        const Viewport& vp = f.result->viewport;
        f.placement = place_result(f.live, f.result->view, aspect_ratio(vp.width, vp.height));
    }
    return f;
}

bool ComputeScheduler::computing() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return busy;
}

std::uint64_t ComputeScheduler::passes() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return pass_count;
}

std::uint64_t ComputeScheduler::failures() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return failure_count;
}

bool ComputeScheduler::wait_idle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mtx);
    return cv_idle.wait_for(lock, timeout,
                            [this] { return !busy && (stopping || !dirty); });
}

// -----------------------------------------------------------------------
// Compute side
// -----------------------------------------------------------------------
std::shared_ptr<ComputeResult>
ComputeScheduler::run_pass(const ViewState& vs, const Viewport& vp)
{
    const ComputeRequest req  = request_for(vs, vp.width, vp.height);
    const PrecisionMode  mode = select_mode(req.xmin, req.xmax, req.width);

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    auto result = std::make_shared<ComputeResult>();
    result->buffer = backend(req, mode);
    if (result->buffer.width != req.width || result->buffer.height != req.height
        || result->buffer.values.size()
               != static_cast<size_t>(req.width) * static_cast<size_t>(req.height))
        throw std::runtime_error("compute backend returned a "
            + std::to_string(result->buffer.width) + "x"
            + std::to_string(result->buffer.height) + " buffer for a "
            + std::to_string(req.width) + "x" + std::to_string(req.height) + " request");

    result->stats      = compute_normalization(result->buffer, cfg);
    result->view       = vs;
    result->viewport   = vp;
    result->mode       = mode;
    result->compute_ms = std::chrono::duration<double, std::milli>(
                             clock::now() - t0).count();

    engine_log()->info("Computed: {:.3f}s | Zoom: {:.2e} | Iter: {} | Mode: {}",
                       result->compute_ms / 1000.0, zoom_display(vs), vs.max_iter,
                       precision_mode_name(mode));
    return result;
}

void ComputeScheduler::worker_loop()
{
    std::unique_lock<std::mutex> lock(mtx);
    while (true) {
        cv_work.wait(lock, [this] { return dirty || stopping; });
        if (stopping) return;

        if (repair_view(live))
            engine_log()->warn("view state out of range, reset to zoom {} center ({}, {})",
                               decimal_to_string(live.zoom),
                               decimal_to_string(live.center_x),
                               decimal_to_string(live.center_y));

        const ViewState snapshot    = live;
        const Viewport  snapshot_vp = live_viewport;
        dirty = false;
        busy  = true;
        lock.unlock();

        std::shared_ptr<ComputeResult> result;
        try {
            result = run_pass(snapshot, snapshot_vp);
        } catch (const std::exception& e) {
            engine_log()->error("compute pass failed: {}", e.what());
        } catch (...) {
            // Whatever a backend throws, the previous result stays published
            engine_log()->error("compute pass failed: unknown exception");
        }

        lock.lock();
        if (result) {
            result->pass = ++pass_count;
            published    = std::move(result);
        } else {
            ++failure_count;
        }
        busy = false;
        // Changes that arrived mid-pass get one more pass on the latest view
        if (live != snapshot || live_viewport != snapshot_vp) dirty = true;
        cv_idle.notify_all();
    }
}
