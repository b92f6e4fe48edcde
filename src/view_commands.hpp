#pragma once

#include "view_state.hpp"

#include <variant>

// Pixel size of the interactive viewport; its ratio is the view aspect.
struct Viewport {
    int width  = 800;
    int height = 600;
};

inline bool operator==(const Viewport& a, const Viewport& b)
{
    return a.width == b.width && a.height == b.height;
}
inline bool operator!=(const Viewport& a, const Viewport& b) { return !(a == b); }

// Scroll: zoom by 1.1^steps keeping the plane point under `cursor` fixed.
// Negative steps zoom out. Re-derives max_iter from the iteration policy.
struct ZoomAt {
    NdcPoint cursor;
    int      steps = 1;
};

// Click: move the center to the plane point under `cursor`.
struct CenterAt {
    NdcPoint cursor;
};

// Drag: shift the center by `delta` NDC units of the current view.
struct PanBy {
    NdcPoint delta;
};

struct SetViewport {
    int width  = 800;
    int height = 600;
};

struct SetMaxIter {
    int max_iter = 512;
};

// Back to the initial view, keeping the viewport.
struct ResetView {};

using ViewCommand = std::variant<ZoomAt, CenterAt, PanBy, SetViewport, SetMaxIter, ResetView>;

constexpr double kZoomStep = 1.1;

// Applies one command. `initial` is the state ResetView returns to.
// Returns true if the view or the viewport changed.
bool apply_command(ViewState& vs, Viewport& vp, const ViewState& initial,
                   const ViewCommand& cmd);
