#include "viewer/graphics/model_normalizer.h"
#include "viewer/graphics/idle_clip_selector.h"
#include "common/logging.h"
#include "common/util/strings.h"

#include <algorithm>
#include <cmath>
#include <regex>

namespace CVW {
namespace Graphics {

namespace {

// Linear-interpolated quantile of sorted values
float quantile(const std::vector<float>& sorted, float q) {
    if (sorted.empty()) {
        return 0.0f;
    }
    const float pos = (sorted.size() - 1) * q;
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const float frac = pos - static_cast<float>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

struct Range {
    float lo;
    float hi;
};

Range iqrRange(std::vector<float> values, float factor) {
    std::sort(values.begin(), values.end());
    const float q1 = quantile(values, 0.25f);
    const float q3 = quantile(values, 0.75f);
    const float iqr = q3 - q1;
    return {q1 - factor * iqr, q3 + factor * iqr};
}

bool usable(float h) {
    return std::isfinite(h) && h > 0.0f;
}

} // namespace

const char* heightSourceName(HeightSource source) {
    switch (source) {
        case HeightSource::Bones: return "bones";
        case HeightSource::BodyJoints: return "body joints";
        case HeightSource::MeshBounds: return "mesh bounds";
        case HeightSource::Floor: return "floor";
    }
    return "unknown";
}

bool ModelNormalizer::isBodyJoint(const std::string& name) {
    static const std::regex helper("buffbone|recall|dummy", std::regex::icase);
    return !std::regex_search(name, helper);
}

const JointSample* ModelNormalizer::findJoint(const std::vector<JointSample>& joints,
                                              const std::string& name) const {
    for (const auto& joint : joints) {
        if (Strings::EqualFold(joint.name, name)) {
            return &joint;
        }
    }
    return nullptr;
}

std::optional<Bounds3> ModelNormalizer::bodyJointBounds(const std::vector<JointSample>& joints) const {
    std::vector<glm::vec3> body;
    for (const auto& joint : joints) {
        if (isBodyJoint(joint.name)) {
            body.push_back(joint.worldPosition);
        }
    }
    if (body.size() < settings_.minBodyJoints) {
        return std::nullopt;
    }

    std::vector<float> xs;
    std::vector<float> zs;
    for (const auto& p : body) {
        xs.push_back(p.x);
        zs.push_back(p.z);
    }
    const Range rx = iqrRange(xs, settings_.iqrFactor);
    const Range rz = iqrRange(zs, settings_.iqrFactor);

    Bounds3 box;
    for (const auto& p : body) {
        if (p.x >= rx.lo && p.x <= rx.hi && p.z >= rz.lo && p.z <= rz.hi) {
            box.extend(p);
        }
    }
    if (!box.valid) {
        LOG_TRACE(MOD_MODEL, "IQR filter rejected all {} body joints, using them all", body.size());
        for (const auto& p : body) {
            box.extend(p);
        }
    }
    return box;
}

float ModelNormalizer::inGameScale(float rawHeight) {
    const float ratio = std::max(rawHeight, kMinRawHeight) / kInGameReferenceHeight;
    return std::min(std::max(ratio, kInGameMinScale), kInGameMaxScale);
}

NormalizedPose ModelNormalizer::normalize(IModelAsset& model, const std::optional<std::string>& preferredIdle,
                                          const Assets::SizeOverride& sizeOverride) const {
    std::vector<std::string> preferred;
    if (preferredIdle) {
        preferred.push_back(*preferredIdle);
    }
    return normalize(model, preferred, sizeOverride);
}

NormalizedPose ModelNormalizer::normalize(IModelAsset& model, const std::vector<std::string>& preferredIdles,
                                          const Assets::SizeOverride& sizeOverride) const {
    NormalizedPose pose;

    model.setVisible(false);
    model.setRootTransform(1.0f, glm::vec3(0.0f));

    // Idle pose
    pose.idleClipName = IdleClipSelector::findIdleName(model.getClipNames(), preferredIdles);
    if (pose.idleClipName && model.playClip(*pose.idleClipName)) {
        model.advance(settings_.primeTickSeconds);
        model.pause();
        LOG_DEBUG(MOD_MODEL, "Idle clip '{}'", *pose.idleClipName);
    } else {
        LOG_DEBUG(MOD_MODEL, "No idle clip, using bind pose");
        pose.idleClipName.reset();
    }

    // Mirrored exports carry negative scales that flip normals and bounds
    model.visitNodeScales([](const std::string& node, glm::vec3& scale) {
        if (scale.x < 0.0f || scale.y < 0.0f || scale.z < 0.0f) {
            LOG_TRACE(MOD_MODEL, "Flipping negative scale on '{}'", node);
            scale = glm::abs(scale);
        }
    });
    model.updateTransforms();

    // Height
    std::vector<JointSample> joints = model.getJoints();
    const JointSample* ground = findJoint(joints, settings_.groundJoint);
    const JointSample* overhead = findJoint(joints, settings_.overheadJoint);

    float height = 0.0f;
    std::optional<Bounds3> bodyBox;
    if (ground && overhead) {
        height = std::fabs(overhead->worldPosition.y - ground->worldPosition.y);
        pose.heightSource = HeightSource::Bones;
    }
    if (!usable(height) && settings_.useBodyJoints) {
        bodyBox = bodyJointBounds(joints);
        if (bodyBox) {
            height = bodyBox->height();
            pose.heightSource = HeightSource::BodyJoints;
        }
    }
    if (!usable(height)) {
        height = model.getVisibleMeshBounds().height();
        pose.heightSource = HeightSource::MeshBounds;
    }
    if (!usable(height)) {
        height = 0.0f;
        pose.heightSource = HeightSource::Floor;
    }
    pose.measuredHeight = height;
    pose.inGameScale = inGameScale(height);

    pose.scale = settings_.targetHeight / std::max(height, settings_.minHeight) * sizeOverride.scale;
    if (!std::isfinite(pose.scale) || pose.scale <= 0.0f) {
        pose.scale = settings_.targetHeight / settings_.minHeight;
    }
    LOG_DEBUG(MOD_MODEL, "Height {:.3f} from {}, scale {:.4f}", height, heightSourceName(pose.heightSource),
              pose.scale);

    // Placement, measured after scaling
    model.setRootTransform(pose.scale, glm::vec3(0.0f));
    model.updateTransforms();

    glm::vec3 center(0.0f);
    float footY = 0.0f;
    joints = model.getJoints();
    ground = findJoint(joints, settings_.groundJoint);
    if (ground) {
        center = ground->worldPosition;
        footY = ground->worldPosition.y;
        LOG_TRACE(MOD_MODEL, "Placed on ground joint");
    } else {
        std::optional<Bounds3> box;
        if (settings_.useBodyJoints) {
            box = bodyJointBounds(joints);
        }
        if (!box) {
            Bounds3 mesh = model.getVisibleMeshBounds();
            if (mesh.valid) {
                box = mesh;
            }
        }
        if (box) {
            center = box->center();
            footY = box->min.y;
        }
    }

    const glm::vec3 position(-center.x + sizeOverride.xShift,
                             -footY + settings_.baselineY + sizeOverride.yShift,
                             -center.z + sizeOverride.zShift);
    pose.centerOffsetX = position.x;
    pose.groundOffsetY = position.y;
    pose.centerOffsetZ = position.z;

    model.setRootTransform(pose.scale, position);
    model.updateTransforms();
    model.setVisible(true);
    return pose;
}

} // namespace Graphics
} // namespace CVW
