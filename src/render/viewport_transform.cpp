#include <paygraph/render/viewport_transform.h>

#include <algorithm>
#include <cmath>

namespace paygraph {
namespace render {

ViewportTransform::ViewportTransform(const ZoomLimits& limits)
    : limits_(limits), pan_(0.0f, 0.0f), scale_(1.0f) {
    if (limits_.min_scale <= 0.0f) limits_.min_scale = 0.01f;
    if (limits_.max_scale < limits_.min_scale) limits_.max_scale = limits_.min_scale;
    scale_ = ClampScale(1.0f);
}

float ViewportTransform::ClampScale(float scale) const {
    return std::max(limits_.min_scale, std::min(scale, limits_.max_scale));
}

ImVec2 ViewportTransform::WorldToScreen(const ImVec2& world_pos) const {
    return ImVec2(world_pos.x * scale_ + pan_.x,
                  world_pos.y * scale_ + pan_.y);
}

ImVec2 ViewportTransform::ScreenToWorld(const ImVec2& screen_pos) const {
    return ImVec2((screen_pos.x - pan_.x) / scale_,
                  (screen_pos.y - pan_.y) / scale_);
}

bool ViewportTransform::ZoomAt(const ImVec2& cursor, float factor) {
    if (!std::isfinite(factor) || factor <= 0.0f) {
        return false;
    }
    float new_scale = ClampScale(scale_ * factor);
    if (new_scale == scale_) {
        return false;
    }
    float ratio = new_scale / scale_;
    pan_.x = cursor.x - (cursor.x - pan_.x) * ratio;
    pan_.y = cursor.y - (cursor.y - pan_.y) * ratio;
    scale_ = new_scale;
    return true;
}

bool ViewportTransform::ZoomAroundCenter(float factor, const ImVec2& viewport_size) {
    return ZoomAt(ImVec2(viewport_size.x * 0.5f, viewport_size.y * 0.5f), factor);
}

void ViewportTransform::PanBy(const ImVec2& delta) {
    pan_.x += delta.x;
    pan_.y += delta.y;
}

void ViewportTransform::Reset() {
    pan_ = ImVec2(0.0f, 0.0f);
    scale_ = ClampScale(1.0f);
}

void ViewportTransform::Set(const ImVec2& pan, float scale) {
    pan_ = pan;
    scale_ = std::isfinite(scale) ? ClampScale(scale) : scale_;
}

} // namespace render
} // namespace paygraph
