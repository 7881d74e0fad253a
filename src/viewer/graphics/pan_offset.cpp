#include "viewer/graphics/pan_offset.h"

#include <algorithm>
#include <cmath>

namespace CVW {
namespace Graphics {

PanLimits computePanLimits(float panelW, float panelH, float imageW, float imageH) {
    PanLimits limits;
    if (panelW <= 0.0f || panelH <= 0.0f) {
        return limits;
    }

    const float natW = imageW > 0.0f ? imageW : panelW;
    const float natH = imageH > 0.0f ? imageH : panelH;
    const float scale = std::max(panelW / natW, panelH / natH);
    const float renderedW = std::round(natW * scale);
    const float renderedH = std::round(natH * scale);

    limits.maxX = std::max((renderedW - panelW) / 2.0f, 0.0f);
    limits.maxY = std::max((renderedH - panelH) / 2.0f, 0.0f);
    return limits;
}

PanOffset clampPan(const PanOffset& offset, const PanLimits& limits) {
    PanOffset out;
    out.x = std::clamp(offset.x, -limits.maxX, limits.maxX);
    out.y = std::clamp(offset.y, -limits.maxY, limits.maxY);
    return out;
}

void PanDragController::setGeometry(float panelW, float panelH, float imageW, float imageH) {
    limits_ = computePanLimits(panelW, panelH, imageW, imageH);
    if (!dragging_) {
        offset_ = clampPan(offset_, limits_);
    }
}

void PanDragController::pointerDown(float x, float y) {
    dragging_ = true;
    startX_ = x;
    startY_ = y;
    origin_ = offset_;
}

void PanDragController::pointerMove(float x, float y) {
    if (!dragging_) {
        return;
    }
    PanOffset wanted;
    wanted.x = origin_.x + (x - startX_);
    wanted.y = origin_.y + (y - startY_);
    offset_ = clampPan(wanted, limits_);
}

void PanDragController::pointerUp() {
    dragging_ = false;
    offset_ = clampPan(offset_, limits_);
}

void PanDragController::reset() {
    dragging_ = false;
    offset_ = PanOffset{};
}

} // namespace Graphics
} // namespace CVW
