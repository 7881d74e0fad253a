#include "viewer/graphics/irrlicht_model_asset.h"
#include "common/logging.h"

namespace CVW {
namespace Graphics {

namespace {

glm::vec3 toGlm(const irr::core::vector3df& v) {
    return glm::vec3(v.X, v.Y, v.Z);
}

irr::core::vector3df toIrr(const glm::vec3& v) {
    return irr::core::vector3df(v.x, v.y, v.z);
}

} // namespace

IrrlichtModelAsset::IrrlichtModelAsset(irr::scene::ISceneNode* root,
                                       irr::scene::IAnimatedMeshSceneNode* animated,
                                       std::vector<AnimationClip> clips,
                                       irr::f32 framesPerSecond)
    : root_(root)
    , animated_(animated)
    , clips_(std::move(clips))
    , fps_(framesPerSecond)
{
    if (animated_ && animated_->getJointCount() > 0) {
        // Bone nodes follow the animation when animateJoints() runs
        animated_->setJointMode(irr::scene::EJUOR_READ);
    }
}

std::vector<AnimationClip> IrrlichtModelAsset::defaultClips(irr::scene::IAnimatedMeshSceneNode* animated) {
    std::vector<AnimationClip> clips;
    if (animated && animated->getMesh() && animated->getMesh()->getFrameCount() > 1) {
        AnimationClip clip;
        clip.name = "Idle";
        clip.startFrame = 0;
        clip.endFrame = static_cast<irr::s32>(animated->getMesh()->getFrameCount()) - 1;
        clips.push_back(clip);
    }
    return clips;
}

std::vector<std::string> IrrlichtModelAsset::getClipNames() const {
    std::vector<std::string> names;
    names.reserve(clips_.size());
    for (const auto& clip : clips_) {
        names.push_back(clip.name);
    }
    return names;
}

bool IrrlichtModelAsset::playClip(const std::string& name) {
    return playClip(name, true);
}

bool IrrlichtModelAsset::playClip(const std::string& name, bool loop) {
    if (!animated_) {
        return false;
    }
    for (const auto& clip : clips_) {
        if (clip.name == name) {
            animated_->setFrameLoop(clip.startFrame, clip.endFrame);
            animated_->setCurrentFrame(static_cast<irr::f32>(clip.startFrame));
            animated_->setAnimationSpeed(fps_);
            animated_->setLoopMode(loop);
            activeClip_ = name;
            loop_ = loop;
            return true;
        }
    }
    LOG_DEBUG(MOD_GRAPHICS, "Clip '{}' not found", name);
    return false;
}

void IrrlichtModelAsset::advance(float seconds) {
    if (!animated_) {
        return;
    }
    const irr::f32 frame = animated_->getFrameNr() + seconds * animated_->getAnimationSpeed();
    const irr::f32 end = static_cast<irr::f32>(animated_->getEndFrame());
    animated_->setCurrentFrame(frame > end ? end : frame);
    if (animated_->getJointCount() > 0) {
        animated_->animateJoints(true);
    }
}

bool IrrlichtModelAsset::clipFinished() const {
    if (!animated_ || loop_ || activeClip_.empty()) {
        return false;
    }
    return animated_->getFrameNr() >= static_cast<irr::f32>(animated_->getEndFrame());
}

void IrrlichtModelAsset::pause() {
    if (animated_) {
        animated_->setAnimationSpeed(0.0f);
    }
}

void IrrlichtModelAsset::resume() {
    if (animated_ && !activeClip_.empty()) {
        animated_->setAnimationSpeed(fps_);
    }
}

void IrrlichtModelAsset::collectNodes(irr::scene::ISceneNode* node,
                                      std::vector<irr::scene::ISceneNode*>& out) const {
    out.push_back(node);
    const auto& children = node->getChildren();
    for (auto it = children.begin(); it != children.end(); ++it) {
        collectNodes(*it, out);
    }
}

// Visibility ignoring the root, which stays hidden while the model is measured
bool IrrlichtModelAsset::visibleBelowRoot(irr::scene::ISceneNode* node) const {
    for (irr::scene::ISceneNode* n = node; n && n != root_; n = n->getParent()) {
        if (!n->isVisible()) {
            return false;
        }
    }
    return true;
}

std::vector<irr::scene::ISceneNode*> IrrlichtModelAsset::subtree() const {
    std::vector<irr::scene::ISceneNode*> nodes;
    if (root_) {
        collectNodes(root_, nodes);
    }
    return nodes;
}

void IrrlichtModelAsset::visitNodeScales(const std::function<void(const std::string&, glm::vec3&)>& fn) {
    for (irr::scene::ISceneNode* node : subtree()) {
        glm::vec3 scale = toGlm(node->getScale());
        const glm::vec3 before = scale;
        fn(node->getName(), scale);
        if (scale != before) {
            node->setScale(toIrr(scale));
        }
    }
}

std::vector<JointSample> IrrlichtModelAsset::getJoints() {
    std::vector<JointSample> joints;

    if (animated_) {
        const irr::u32 count = animated_->getJointCount();
        for (irr::u32 i = 0; i < count; ++i) {
            irr::scene::IBoneSceneNode* bone = animated_->getJointNode(i);
            if (!bone) {
                continue;
            }
            bone->updateAbsolutePosition();
            joints.push_back({bone->getName(), toGlm(bone->getAbsolutePosition())});
        }
    }

    for (irr::scene::ISceneNode* node : subtree()) {
        if (node->getType() == irr::scene::ESNT_EMPTY && node->getName()[0] != '\0') {
            joints.push_back({node->getName(), toGlm(node->getAbsolutePosition())});
        }
    }
    return joints;
}

Bounds3 IrrlichtModelAsset::getVisibleMeshBounds() {
    Bounds3 bounds;
    for (irr::scene::ISceneNode* node : subtree()) {
        const irr::scene::ESCENE_NODE_TYPE type = node->getType();
        if (type != irr::scene::ESNT_MESH && type != irr::scene::ESNT_ANIMATED_MESH &&
            type != irr::scene::ESNT_CUBE && type != irr::scene::ESNT_SPHERE) {
            continue;
        }
        if (!visibleBelowRoot(node)) {
            continue;
        }
        const irr::core::aabbox3df box = node->getTransformedBoundingBox();
        if (box.isEmpty()) {
            continue;
        }
        bounds.extend(toGlm(box.MinEdge));
        bounds.extend(toGlm(box.MaxEdge));
    }
    return bounds;
}

void IrrlichtModelAsset::setRootTransform(float scale, const glm::vec3& position) {
    if (!root_) {
        return;
    }
    root_->setScale(irr::core::vector3df(scale, scale, scale));
    root_->setPosition(toIrr(position));
}

void IrrlichtModelAsset::setVisible(bool visible) {
    if (root_) {
        root_->setVisible(visible);
    }
}

void IrrlichtModelAsset::updateTransforms() {
    for (irr::scene::ISceneNode* node : subtree()) {
        node->updateAbsolutePosition();
    }
    if (animated_ && animated_->getJointCount() > 0) {
        animated_->animateJoints(true);
    }
}

} // namespace Graphics
} // namespace CVW
