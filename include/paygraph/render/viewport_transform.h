#ifndef PAYGRAPH_RENDER_VIEWPORT_TRANSFORM_H
#define PAYGRAPH_RENDER_VIEWPORT_TRANSFORM_H

#include <imgui.h>

namespace paygraph {
namespace render {

struct ZoomLimits {
    float min_scale = 0.2f;
    float max_scale = 3.0f;
};

/*
 * Pan/zoom state of the canvas. Screen coordinates are relative to the canvas origin;
 * world coordinates are the simulation's.
 *   screen = world * k + pan
 *   world  = (screen - pan) / k
 * k is kept inside ZoomLimits at all times.
 */
class ViewportTransform {
public:
    explicit ViewportTransform(const ZoomLimits& limits = ZoomLimits());

    ImVec2 WorldToScreen(const ImVec2& world_pos) const;
    ImVec2 ScreenToWorld(const ImVec2& screen_pos) const;

    // Zooms by factor keeping the world point under cursor fixed on screen.
    // Returns false if nothing changed (factor not finite/positive, or already at a limit).
    bool ZoomAt(const ImVec2& cursor, float factor);

    // Toolbar zoom: same as ZoomAt with the cursor at the viewport center.
    bool ZoomAroundCenter(float factor, const ImVec2& viewport_size);

    void PanBy(const ImVec2& delta);
    void Reset();

    ImVec2 Pan() const { return pan_; }
    float Scale() const { return scale_; }
    const ZoomLimits& Limits() const { return limits_; }

    // Sets state directly; scale is clamped.
    void Set(const ImVec2& pan, float scale);

private:
    float ClampScale(float scale) const;

    ZoomLimits limits_;
    ImVec2 pan_;
    float scale_;
};

} // namespace render
} // namespace paygraph

#endif // PAYGRAPH_RENDER_VIEWPORT_TRANSFORM_H
