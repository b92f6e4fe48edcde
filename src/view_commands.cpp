#include "view_commands.hpp"
#include "iteration_policy.hpp"

#include <algorithm>

namespace {

struct CommandApplier {
    ViewState&       vs;
    Viewport&        vp;
    const ViewState& initial;

    Decimal aspect() const { return aspect_ratio(vp.width, vp.height); }

    bool operator()(const ZoomAt& c) const
    {
        if (c.steps == 0) return false;

        const Decimal    a      = aspect();
        const PlanePoint anchor = ndc_to_world(vs, a, c.cursor);

        static const Decimal step("1.1");
        Decimal zoom = vs.zoom;
        for (int i = 0; i < c.steps; ++i)  zoom *= step;
        for (int i = 0; i < -c.steps; ++i) zoom /= step;
        const Decimal limit = zoom_limit(anchor.x, anchor.y);
        if (zoom > limit) zoom = limit;

        // Put the anchor back under the cursor at the new zoom
        const Decimal half_h = Decimal(1) / (zoom * 2);
        const Decimal half_w = a * half_h;
        vs.zoom     = zoom;
        vs.center_x = anchor.x - Decimal(c.cursor.x) * half_w;
        vs.center_y = anchor.y - Decimal(c.cursor.y) * half_h;
        // The new center may sit marginally farther out than the anchor
        const Decimal center_limit = zoom_limit(vs.center_x, vs.center_y);
        if (vs.zoom > center_limit) vs.zoom = center_limit;
        vs.max_iter = cap_for(vs.zoom);
        return true;
    }

    bool operator()(const CenterAt& c) const
    {
        const PlanePoint target = ndc_to_world(vs, aspect(), c.cursor);
        if (target.x == vs.center_x && target.y == vs.center_y) return false;
        vs.center_x = target.x;
        vs.center_y = target.y;
        return true;
    }

    bool operator()(const PanBy& c) const
    {
        if (c.delta.x == 0.0 && c.delta.y == 0.0) return false;
        const Decimal half_h = Decimal(1) / (vs.zoom * 2);
        const Decimal half_w = aspect() * half_h;
        vs.center_x += Decimal(c.delta.x) * half_w;
        vs.center_y += Decimal(c.delta.y) * half_h;
        return true;
    }

    bool operator()(const SetViewport& c) const
    {
        const Viewport next { std::max(c.width, 1), std::max(c.height, 1) };
        if (next == vp) return false;
        vp = next;
        return true;
    }

    bool operator()(const SetMaxIter& c) const
    {
        // Non-positive hands the cap back to the zoom policy
        const int next = c.max_iter > 0 ? c.max_iter : cap_for(vs.zoom);
        if (next == vs.max_iter) return false;
        vs.max_iter = next;
        return true;
    }

    bool operator()(const ResetView&) const
    {
        if (vs == initial) return false;
        vs = initial;
        return true;
    }
};

} // namespace

bool apply_command(ViewState& vs, Viewport& vp, const ViewState& initial,
                   const ViewCommand& cmd)
{
    return std::visit(CommandApplier{ vs, vp, initial }, cmd);
}
