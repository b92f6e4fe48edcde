#pragma once

#include "compute_engine.hpp"
#include "engine_config.hpp"
#include "iteration_buffer.hpp"
#include "normalization.hpp"
#include "precision.hpp"
#include "view_commands.hpp"
#include "view_state.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

// One finished pass, immutable once published.
struct ComputeResult {
    IterationBuffer    buffer;
    ViewState          view;        // state the buffer was computed for
    Viewport           viewport;
    PrecisionMode      mode       = PrecisionMode::Double;
    NormalizationStats stats;
    double             compute_ms = 0.0;
    std::uint64_t      pass       = 0;   // 1 for the first published result
};

// What a consumer needs to draw: the latest result, the live view and the
// placement of the one inside the other, all taken under one lock.
struct Frame {
    std::shared_ptr<const ComputeResult> result;   // null before the first pass
    ViewState live;
    Viewport  viewport;
    Placement placement;
};

// Kernel call used by the scheduler; the default runs a ComputeEngine.
using ComputeBackend =
    std::function<IterationBuffer(const ComputeRequest&, PrecisionMode)>;

// Owns the view state and a background compute thread.
//
// Idle -> Computing -> Idle. post() mutates the view and marks it dirty;
// the worker snapshots the dirty view, computes it without holding the
// lock and publishes the result. Commands posted meanwhile only leave the
// view dirty, so any number of them collapse into one follow-up pass on
// the latest view. A pass that throws is logged and counted; the previous
// result stays published.
class ComputeScheduler {
public:
    explicit ComputeScheduler(const EngineConfig& cfg = EngineConfig{});
    ComputeScheduler(const EngineConfig& cfg, ComputeBackend backend);
    ~ComputeScheduler();

    ComputeScheduler(const ComputeScheduler&)            = delete;
    ComputeScheduler& operator=(const ComputeScheduler&) = delete;

    // Applies the command to the live view. Returns false if nothing changed.
    bool post(const ViewCommand& cmd);

    ViewState view() const;
    Viewport  viewport() const;
    std::shared_ptr<const ComputeResult> latest() const;
    Frame     frame() const;

    bool          computing() const;
    std::uint64_t passes() const;
    std::uint64_t failures() const;

    // Blocks until no pass is running and none is pending (after stop(),
    // only until no pass is running).
    // Returns false if that did not happen within `timeout`.
    bool wait_idle(std::chrono::milliseconds timeout);

    // Joins the worker; a running pass completes first.
    void stop();

private:
    void start();
    void worker_loop();
    std::shared_ptr<ComputeResult> run_pass(const ViewState& vs, const Viewport& vp);

    const EngineConfig             cfg;
    std::unique_ptr<ComputeEngine> engine;    // null when a backend is injected
    ComputeBackend                 backend;

    mutable std::mutex      mtx;
    std::condition_variable cv_work;
    std::condition_variable cv_idle;

    ViewState                            live;
    Viewport                             live_viewport;
    std::shared_ptr<const ComputeResult> published;
    bool          dirty         = true;   // the initial view still has to be computed
    bool          busy          = false;
    bool          stopping      = false;
    std::uint64_t pass_count    = 0;
    std::uint64_t failure_count = 0;

    std::thread worker;
};
