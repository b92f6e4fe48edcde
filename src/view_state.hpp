#pragma once

#include "decimal.hpp"

// Navigation state of the viewer. The viewport spans 1/zoom plane units
// vertically and aspect/zoom horizontally around the center.
struct ViewState {
    Decimal center_x {"-0.5"};
    Decimal center_y {"0"};
    Decimal zoom     {"1"};
    int     max_iter = 512;
};

bool operator==(const ViewState& a, const ViewState& b);
inline bool operator!=(const ViewState& a, const ViewState& b) { return !(a == b); }

struct ViewBounds {
    Decimal xmin, xmax;
    Decimal ymin, ymax;
};

struct PlanePoint {
    Decimal x, y;
};

// Normalized device coordinates: [-1, 1] on both axes, y pointing up.
struct NdcPoint {
    double x = 0.0;
    double y = 0.0;
};

// Placement of a published result inside the live viewport, in texture
// units: the live view center sits at uv = 0.5 + offset and one live
// viewport spans `scale` result textures.
struct Placement {
    double offset_x = 0.0;
    double offset_y = 0.0;
    double scale    = 1.0;
};

inline double zoom_display(const ViewState& vs)
{
    return vs.zoom.convert_to<double>();
}

Decimal aspect_ratio(int width, int height);

// Zoom beyond which the half-width of the viewport can no longer be
// represented next to a center of magnitude ~1.
const Decimal& max_zoom();

// max_zoom() scaled down by max(|x|, |y|, 1): the deepest zoom whose
// bounds stay distinct around the point (x, y).
Decimal zoom_limit(const Decimal& x, const Decimal& y);

ViewBounds derive_bounds(const ViewState& vs, const Decimal& aspect);

NdcPoint   window_to_ndc(double window_x, double window_y, int width, int height);
PlanePoint ndc_to_world(const ViewState& vs, const Decimal& aspect, NdcPoint ndc);
NdcPoint   world_to_ndc(const ViewState& vs, const Decimal& aspect, const PlanePoint& p);

// True when the state can be handed to a kernel: finite values,
// 0 < zoom <= zoom_limit(center), max_iter > 0.
bool view_is_valid(const ViewState& vs);

// Brings an invalid state back into range. Returns true if anything changed.
bool repair_view(ViewState& vs);

Placement place_result(const ViewState& live, const ViewState& computed,
                       const Decimal& computed_aspect);
