#ifndef CVW_GRAPHICS_PAN_OFFSET_H
#define CVW_GRAPHICS_PAN_OFFSET_H

namespace CVW {
namespace Graphics {

struct PanOffset {
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const PanOffset& o) const { return x == o.x && y == o.y; }
};

struct PanLimits {
    float maxX = 0.0f;
    float maxY = 0.0f;
};

/**
 * How far an image drawn to cover a panel can be dragged before an edge of
 * the panel shows through. The image is scaled by max(panelW / imageW,
 * panelH / imageH) and rounded to whole pixels. An image size of zero means
 * "not known yet" and is treated as the panel size.
 */
PanLimits computePanLimits(float panelW, float panelH, float imageW, float imageH);

PanOffset clampPan(const PanOffset& offset, const PanLimits& limits);

/**
 * PanDragController - Pointer-drag panning of the splash art behind the model.
 *
 * While dragging the offset follows the pointer, clamped to the limits;
 * releasing snaps back into range if the geometry changed mid-drag.
 */
class PanDragController {
public:
    void setGeometry(float panelW, float panelH, float imageW, float imageH);

    void pointerDown(float x, float y);
    void pointerMove(float x, float y);
    void pointerUp();

    // Back to the centered position (new skin)
    void reset();

    const PanOffset& offset() const { return offset_; }
    const PanLimits& limits() const { return limits_; }
    bool isDragging() const { return dragging_; }

private:
    PanLimits limits_;
    PanOffset offset_;
    PanOffset origin_;
    float startX_ = 0.0f;
    float startY_ = 0.0f;
    bool dragging_ = false;
};

} // namespace Graphics
} // namespace CVW

#endif // CVW_GRAPHICS_PAN_OFFSET_H
