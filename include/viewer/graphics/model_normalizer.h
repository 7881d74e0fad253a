#ifndef CVW_GRAPHICS_MODEL_NORMALIZER_H
#define CVW_GRAPHICS_MODEL_NORMALIZER_H

#include "viewer/assets/asset_catalog.h"
#include "viewer/graphics/model_asset.h"

#include <optional>
#include <string>
#include <vector>

namespace CVW {
namespace Graphics {

struct NormalizerSettings {
    float targetHeight = 3.4f;
    float baselineY = -1.7f;
    float minHeight = 0.01f;
    std::string groundJoint = "Buffbone_Glb_Ground_Loc";
    std::string overheadJoint = "C_Buffbone_Glb_Overhead_Loc";
    bool useBodyJoints = false;     // body-joint tier between bones and mesh bounds
    size_t minBodyJoints = 4;
    float iqrFactor = 1.5f;
    float primeTickSeconds = 1.0f / 30.0f;
};

enum class HeightSource {
    Bones,       // ground and overhead joints
    BodyJoints,
    MeshBounds,
    Floor        // nothing measurable, minimum height used
};

const char* heightSourceName(HeightSource source);

/**
 * NormalizedPose - Result of normalizing one loaded model. Computed once per
 * asset; the same values are written into the model's root transform.
 */
struct NormalizedPose {
    float scale = 1.0f;
    float groundOffsetY = 0.0f;
    float centerOffsetX = 0.0f;
    float centerOffsetZ = 0.0f;
    std::optional<std::string> idleClipName;
    float measuredHeight = 0.0f;
    HeightSource heightSource = HeightSource::Floor;
    // Size relative to a mid-sized character, for side by side display
    float inGameScale = 1.0f;
};

/**
 * ModelNormalizer - Brings a model of unknown size and pose to a common
 * on-screen height, stands it on the ground plane, centers it and parks it
 * on the first frame of its idle clip.
 *
 * Every missing piece of data falls through to the next, coarser tier; it
 * never fails. The model is hidden while measuring and shown at the end.
 */
class ModelNormalizer {
public:
    explicit ModelNormalizer(NormalizerSettings settings = {}) : settings_(std::move(settings)) {}

    NormalizedPose normalize(IModelAsset& model,
                             const std::optional<std::string>& preferredIdle = std::nullopt,
                             const Assets::SizeOverride& sizeOverride = {}) const;

    // Preferred idle clips are tried in order
    NormalizedPose normalize(IModelAsset& model, const std::vector<std::string>& preferredIdles,
                             const Assets::SizeOverride& sizeOverride = {}) const;

    // Measured height over a 4 unit reference, clamped to [0.65, 1.5]
    static float inGameScale(float rawHeight);

    const NormalizerSettings& settings() const { return settings_; }

    // Exposed for tests
    static bool isBodyJoint(const std::string& name);
    std::optional<Bounds3> bodyJointBounds(const std::vector<JointSample>& joints) const;

private:
    static constexpr float kMinRawHeight = 0.01f;
    static constexpr float kInGameReferenceHeight = 4.0f;
    static constexpr float kInGameMinScale = 0.65f;
    static constexpr float kInGameMaxScale = 1.5f;

    const JointSample* findJoint(const std::vector<JointSample>& joints, const std::string& name) const;

    NormalizerSettings settings_;
};

} // namespace Graphics
} // namespace CVW

#endif // CVW_GRAPHICS_MODEL_NORMALIZER_H
