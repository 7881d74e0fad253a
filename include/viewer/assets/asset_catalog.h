#pragma once

#include <glm/glm.hpp>
#include <json/json.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CVW {
namespace Assets {

struct AlternateForm {
    enum class Kind { Model, Texture };

    std::string alias;          // model alias for Kind::Model
    std::string label;
    Kind kind = Kind::Model;
    std::string textureSegment; // texture file stem for Kind::Texture
    std::string idleAnimation;  // preferred idle clip while the form is shown
};

struct ModelVersion {
    std::string label;
    std::string segment;
    std::string idleAnimation;
    bool hasTexture = false;
};

struct ExtraModelSpec {
    std::vector<std::string> aliases;
    glm::vec3 positionOffset{0.0f};
    float scaleMultiplier = 1.0f;
};

struct SizeOverride {
    float scale = 1.0f;
    float xShift = 0.0f;
    float yShift = 0.0f;
    float zShift = 0.0f;
};

/**
 * AssetCatalog - Per-subject knowledge that cannot be derived from the asset
 * hosts: alternate forms, companion and extra sub-models, historical model
 * versions, preferred idle clips and manual size corrections.
 *
 * Tables are keyed by subject id ("Elise") except the idle and size tables,
 * which use "alias/skinId", "alias" or "skinId" with the most specific key
 * winning.
 */
class AssetCatalog {
public:
    AssetCatalog() = default;

    // Catalog populated with the built-in tables
    static AssetCatalog defaults();

    // Merge a "catalog" JSON object over the current tables. Malformed
    // entries are skipped with a warning; returns false if any were.
    bool loadJson(const Json::Value& catalog);

    const AlternateForm* alternateForm(const std::string& subjectId) const;
    const std::vector<std::string>& companionAliases(const std::string& subjectId) const;
    const std::vector<ModelVersion>& modelVersions(const std::string& subjectId) const;
    const std::vector<ExtraModelSpec>& extraModels(const std::string& subjectId) const;
    std::optional<glm::vec3> mainModelOffset(const std::string& subjectId) const;

    std::optional<std::string> defaultIdleAnimation(const std::string& alias, uint32_t skinId) const;

    // Exact clip name tried before anything else when the model has it
    std::optional<std::string> preferredIdleAnimation(const std::string& alias) const;

    // Size correction: the most specific size override, or else the
    // champion scale for the alias with no shift.
    SizeOverride sizeOverride(const std::string& alias, uint32_t skinId) const;

    void setAlternateForm(const std::string& subjectId, AlternateForm form) { m_forms[subjectId] = std::move(form); }
    void setCompanionAliases(const std::string& subjectId, std::vector<std::string> aliases) { m_companions[subjectId] = std::move(aliases); }
    void setModelVersions(const std::string& subjectId, std::vector<ModelVersion> versions) { m_versions[subjectId] = std::move(versions); }
    void setExtraModels(const std::string& subjectId, std::vector<ExtraModelSpec> specs) { m_extras[subjectId] = std::move(specs); }
    void setMainModelOffset(const std::string& subjectId, const glm::vec3& offset) { m_mainOffsets[subjectId] = offset; }
    void setIdleAnimation(const std::string& key, const std::string& clip) { m_idle[key] = clip; }
    void setPreferredIdleAnimation(const std::string& alias, const std::string& clip);
    void setSizeOverride(const std::string& key, const SizeOverride& o) { m_sizes[key] = o; }
    void setChampionScale(const std::string& alias, float scale) { m_championScales[alias] = scale; }

private:
    std::map<std::string, AlternateForm> m_forms;
    std::map<std::string, std::vector<std::string>> m_companions;
    std::map<std::string, std::vector<ModelVersion>> m_versions;
    std::map<std::string, std::vector<ExtraModelSpec>> m_extras;
    std::map<std::string, glm::vec3> m_mainOffsets;
    std::map<std::string, std::string> m_idle;
    std::map<std::string, std::string> m_preferredIdle;
    std::map<std::string, SizeOverride> m_sizes;
    std::map<std::string, float> m_championScales;
};

const std::vector<std::pair<std::string, std::string>>& builtinIdleAnimations();

} // namespace Assets
} // namespace CVW
