#include "view_state.hpp"
#include "iteration_policy.hpp"

#include <algorithm>
#include <string>

using boost::multiprecision::isfinite;

bool operator==(const ViewState& a, const ViewState& b)
{
    return a.center_x == b.center_x && a.center_y == b.center_y
        && a.zoom == b.zoom && a.max_iter == b.max_iter;
}

Decimal aspect_ratio(int width, int height)
{
    if (width < 1)  width  = 1;
    if (height < 1) height = 1;
    return Decimal(width) / Decimal(height);
}

const Decimal& max_zoom()
{
    // 20 digits of headroom: pixel spacing must stay resolvable at any center
    static const Decimal z("1e" + std::to_string(DEEPZOOM_DEC_DIGITS10 - 20));
    return z;
}

Decimal zoom_limit(const Decimal& x, const Decimal& y)
{
    using boost::multiprecision::abs;
    const Decimal mag = std::max({ abs(x), abs(y), Decimal(1) });
    return max_zoom() / mag;
}

ViewBounds derive_bounds(const ViewState& vs, const Decimal& aspect)
{
    const Decimal half_h = Decimal(1) / (vs.zoom * 2);
    const Decimal half_w = aspect * half_h;
    return { vs.center_x - half_w, vs.center_x + half_w,
             vs.center_y - half_h, vs.center_y + half_h };
}

// -----------------------------------------------------------------------
// Cursor mapping
// -----------------------------------------------------------------------
NdcPoint window_to_ndc(double window_x, double window_y, int width, int height)
{
    if (width < 1)  width  = 1;
    if (height < 1) height = 1;
    NdcPoint p;
    p.x = window_x / width * 2.0 - 1.0;
    p.y = 1.0 - window_y / height * 2.0;   // window rows grow downwards
    return p;
}

PlanePoint ndc_to_world(const ViewState& vs, const Decimal& aspect, NdcPoint ndc)
{
    const Decimal half_h = Decimal(1) / (vs.zoom * 2);
    const Decimal half_w = aspect * half_h;
    return { vs.center_x + Decimal(ndc.x) * half_w,
             vs.center_y + Decimal(ndc.y) * half_h };
}

NdcPoint world_to_ndc(const ViewState& vs, const Decimal& aspect, const PlanePoint& p)
{
    const Decimal half_h = Decimal(1) / (vs.zoom * 2);
    const Decimal half_w = aspect * half_h;
    NdcPoint n;
    n.x = ((p.x - vs.center_x) / half_w).convert_to<double>();
    n.y = ((p.y - vs.center_y) / half_h).convert_to<double>();
    return n;
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------
bool view_is_valid(const ViewState& vs)
{
    return isfinite(vs.center_x) && isfinite(vs.center_y) && isfinite(vs.zoom)
        && vs.zoom > 0 && vs.zoom <= zoom_limit(vs.center_x, vs.center_y)
        && vs.max_iter > 0;
}

bool repair_view(ViewState& vs)
{
    const ViewState defaults;
    bool changed = false;

    if (!isfinite(vs.center_x) || !isfinite(vs.center_y)) {
        vs.center_x = defaults.center_x;
        vs.center_y = defaults.center_y;
        changed = true;
    }
    if (!isfinite(vs.zoom) || vs.zoom <= 0) {
        vs.zoom = defaults.zoom;
        changed = true;
    } else {
        const Decimal limit = zoom_limit(vs.center_x, vs.center_y);
        if (vs.zoom > limit) {
            vs.zoom = limit;
            changed = true;
        }
    }
    if (vs.max_iter <= 0) {
        vs.max_iter = cap_for(vs.zoom);
        changed = true;
    }
    return changed;
}

// -----------------------------------------------------------------------
// Placement of a stale result in the live view
// -----------------------------------------------------------------------
Placement place_result(const ViewState& live, const ViewState& computed,
                       const Decimal& computed_aspect)
{
    const Decimal tex_h = Decimal(1) / computed.zoom;
    const Decimal tex_w = computed_aspect * tex_h;

    Placement p;
    p.scale    = (computed.zoom / live.zoom).convert_to<double>();
    p.offset_x = ((live.center_x - computed.center_x) / tex_w).convert_to<double>();
    p.offset_y = ((live.center_y - computed.center_y) / tex_h).convert_to<double>();
    return p;
}
