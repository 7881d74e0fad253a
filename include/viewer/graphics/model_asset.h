#ifndef CVW_GRAPHICS_MODEL_ASSET_H
#define CVW_GRAPHICS_MODEL_ASSET_H

#include <glm/glm.hpp>
#include <functional>
#include <string>
#include <vector>

namespace CVW {
namespace Graphics {

/**
 * Axis-aligned box in world space. Default-constructed boxes are empty.
 */
struct Bounds3 {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};
    bool valid = false;

    void extend(const glm::vec3& p) {
        if (!valid) {
            min = max = p;
            valid = true;
            return;
        }
        min = glm::min(min, p);
        max = glm::max(max, p);
    }

    glm::vec3 center() const { return (min + max) * 0.5f; }
    float height() const { return valid ? max.y - min.y : 0.0f; }
};

struct JointSample {
    std::string name;
    glm::vec3 worldPosition{0.0f};
};

/**
 * IModelAsset - What the normalizer needs from a loaded model: the names of
 * its animation clips, its joints in world space and its visible mesh
 * bounds, plus control of the root transform.
 *
 * The render surface owns the model; implementations wrap its scene graph.
 */
class IModelAsset {
public:
    virtual ~IModelAsset() = default;

    virtual std::vector<std::string> getClipNames() const = 0;

    // Start a clip from its first frame; false if no clip has that name.
    virtual bool playClip(const std::string& name) = 0;
    virtual void advance(float seconds) = 0;
    virtual void pause() = 0;

    // Visit every node's local scale; the callback may modify it.
    virtual void visitNodeScales(const std::function<void(const std::string& node, glm::vec3& scale)>& fn) = 0;

    // Joint positions in world space under the current root transform.
    virtual std::vector<JointSample> getJoints() = 0;
    virtual Bounds3 getVisibleMeshBounds() = 0;

    virtual void setRootTransform(float scale, const glm::vec3& position) = 0;
    virtual void setVisible(bool visible) = 0;

    // Propagate pending transform changes to world space.
    virtual void updateTransforms() = 0;
};

} // namespace Graphics
} // namespace CVW

#endif // CVW_GRAPHICS_MODEL_ASSET_H
