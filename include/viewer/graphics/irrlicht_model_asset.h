#ifndef CVW_GRAPHICS_IRRLICHT_MODEL_ASSET_H
#define CVW_GRAPHICS_IRRLICHT_MODEL_ASSET_H

#include "viewer/graphics/model_asset.h"

#include <irrlicht.h>
#include <string>
#include <vector>

namespace CVW {
namespace Graphics {

/**
 * Named frame range of an animated mesh.
 */
struct AnimationClip {
    std::string name;
    irr::s32 startFrame = 0;
    irr::s32 endFrame = 0;
};

/**
 * IrrlichtModelAsset - IModelAsset over an Irrlicht scene subtree.
 *
 * Joints are the bone nodes of the animated mesh (if any) plus every named
 * empty scene node under the root. Clips are frame ranges on the animated
 * mesh node supplied by whoever loaded the model. The asset does not own the
 * nodes; the scene manager does.
 */
class IrrlichtModelAsset : public IModelAsset {
public:
    IrrlichtModelAsset(irr::scene::ISceneNode* root,
                       irr::scene::IAnimatedMeshSceneNode* animated,
                       std::vector<AnimationClip> clips,
                       irr::f32 framesPerSecond = 30.0f);

    std::vector<std::string> getClipNames() const override;
    bool playClip(const std::string& name) override;
    void advance(float seconds) override;
    void pause() override;

    void visitNodeScales(const std::function<void(const std::string& node, glm::vec3& scale)>& fn) override;
    std::vector<JointSample> getJoints() override;
    Bounds3 getVisibleMeshBounds() override;

    void setRootTransform(float scale, const glm::vec3& position) override;
    void setVisible(bool visible) override;
    void updateTransforms() override;

    irr::scene::ISceneNode* getRoot() const { return root_; }
    irr::scene::IAnimatedMeshSceneNode* getAnimatedNode() const { return animated_; }
    const std::string& getActiveClip() const { return activeClip_; }

    // Resume playback of the active clip at the normal rate
    void resume();

    // Start a clip that either repeats or holds its last frame
    bool playClip(const std::string& name, bool loop);

    // A clip started without looping has reached its last frame
    bool clipFinished() const;

    // One clip spanning every frame of the mesh, or none for a static mesh.
    static std::vector<AnimationClip> defaultClips(irr::scene::IAnimatedMeshSceneNode* animated);

private:
    void collectNodes(irr::scene::ISceneNode* node, std::vector<irr::scene::ISceneNode*>& out) const;
    std::vector<irr::scene::ISceneNode*> subtree() const;
    bool visibleBelowRoot(irr::scene::ISceneNode* node) const;

    irr::scene::ISceneNode* root_;
    irr::scene::IAnimatedMeshSceneNode* animated_;
    std::vector<AnimationClip> clips_;
    irr::f32 fps_;
    std::string activeClip_;
    bool loop_ = true;
};

} // namespace Graphics
} // namespace CVW

#endif // CVW_GRAPHICS_IRRLICHT_MODEL_ASSET_H
