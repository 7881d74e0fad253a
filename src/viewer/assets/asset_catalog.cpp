#include "viewer/assets/asset_catalog.h"
#include "common/logging.h"
#include "common/util/strings.h"

#include <cmath>

namespace CVW {
namespace Assets {

namespace {

const std::vector<std::string> kNoAliases;
const std::vector<ModelVersion> kNoVersions;
const std::vector<ExtraModelSpec> kNoExtras;

bool readVec3(const Json::Value& v, glm::vec3& out)
{
    if (!v.isArray() || v.size() != 3) {
        return false;
    }
    for (Json::ArrayIndex i = 0; i < 3; ++i) {
        if (!v[i].isNumeric()) {
            return false;
        }
        out[i] = v[i].asFloat();
    }
    return true;
}

bool readStringList(const Json::Value& v, std::vector<std::string>& out)
{
    if (!v.isArray()) {
        return false;
    }
    out.clear();
    for (const auto& item : v) {
        if (!item.isString()) {
            return false;
        }
        out.push_back(item.asString());
    }
    return !out.empty();
}

// Missing keys leave out untouched; a present key of the wrong type fails
bool readOptionalString(const Json::Value& obj, const char* key, std::string& out)
{
    if (!obj.isMember(key)) {
        return true;
    }
    const Json::Value& v = obj[key];
    if (!v.isString()) {
        return false;
    }
    out = v.asString();
    return true;
}

bool readOptionalFloat(const Json::Value& obj, const char* key, float& out)
{
    if (!obj.isMember(key)) {
        return true;
    }
    const Json::Value& v = obj[key];
    if (!v.isNumeric()) {
        return false;
    }
    out = v.asFloat();
    return std::isfinite(out);
}

bool readOptionalBool(const Json::Value& obj, const char* key, bool& out)
{
    if (!obj.isMember(key)) {
        return true;
    }
    const Json::Value& v = obj[key];
    if (!v.isBool()) {
        return false;
    }
    out = v.asBool();
    return true;
}

// "alias/skinId" > first > second
template <typename Map>
auto lookupSpecific(const Map& map, const std::string& alias, uint32_t skinId,
                    bool aliasBeforeSkin) -> const typename Map::mapped_type*
{
    std::string lowered = Strings::ToLower(alias);
    std::string skin = std::to_string(skinId);
    const std::string keys[3] = {
        lowered + "/" + skin,
        aliasBeforeSkin ? lowered : skin,
        aliasBeforeSkin ? skin : lowered,
    };
    for (const auto& key : keys) {
        auto it = map.find(key);
        if (it != map.end()) {
            return &it->second;
        }
    }
    return nullptr;
}

} // namespace

AssetCatalog AssetCatalog::defaults()
{
    AssetCatalog c;

    c.setAlternateForm("Elise", {"elisespider", "Spider Form", AlternateForm::Kind::Model, "", ""});
    c.setAlternateForm("Nidalee", {"nidaleecougar", "Cougar Form", AlternateForm::Kind::Model, "", ""});
    c.setAlternateForm("Shyvana", {"shyvanadragon", "Dragon Form", AlternateForm::Kind::Model, "", ""});
    c.setAlternateForm("Gnar", {"gnarbig", "Mega Gnar", AlternateForm::Kind::Model, "", ""});
    c.setAlternateForm("Quinn", {"quinnvalor", "Valor", AlternateForm::Kind::Model, "", ""});
    c.setAlternateForm("Belveth", {"", "True Form", AlternateForm::Kind::Texture, "belveth_ult", "Spell4_Idle"});

    c.setCompanionAliases("Annie", {"annietibbers"});

    c.setExtraModels("Azir", {
        {{"azirsoldier", "azir_soldier", "azirsandwarrior"}, glm::vec3(0.9f, 0.0f, 1.0f), 1.0f},
        {{"azirtower", "azir_tower", "azirsundisc", "azir_sundisc", "sundisc"}, glm::vec3(0.15f, -0.1f, -3.4f), 2.1f},
    });
    c.setMainModelOffset("Azir", glm::vec3(-0.6f, 0.0f, -0.2f));
    c.setExtraModels("Bard", {
        {{"bardfollower", "bard_follower", "bardmeep"}, glm::vec3(0.95f, 0.0f, 1.2f), 0.18f},
    });

    for (const auto& kv : builtinIdleAnimations()) {
        c.setIdleAnimation(kv.first, kv.second);
    }
    c.setPreferredIdleAnimation("fiddlesticks", "Fiddlesticks_Idle2_Loop");

    c.setChampionScale("ziggs", 0.3f);
    c.setChampionScale("amumu", 0.8f);

    return c;
}

bool AssetCatalog::loadJson(const Json::Value& catalog)
{
    if (catalog.isNull()) {
        return true;
    }
    if (!catalog.isObject()) {
        LOG_WARN(MOD_CONFIG, "catalog: expected an object, ignoring");
        return false;
    }

    bool clean = true;
    auto reject = [&clean](const std::string& table, const std::string& key) {
        LOG_WARN(MOD_CONFIG, "catalog.{}: malformed entry '{}', skipped", table, key);
        clean = false;
    };

    // Absent tables are empty; present ones must be objects
    auto table = [&catalog, &reject](const char* name) -> const Json::Value* {
        if (!catalog.isMember(name)) {
            return nullptr;
        }
        const Json::Value& t = catalog[name];
        if (!t.isObject()) {
            reject(name, "*");
            return nullptr;
        }
        return &t;
    };

    if (const Json::Value* forms = table("alternateForms")) {
        for (const auto& id : forms->getMemberNames()) {
            const Json::Value& f = (*forms)[id];
            AlternateForm form;
            std::string kind = "model";
            if (!f.isObject() ||
                !readOptionalString(f, "alias", form.alias) ||
                !readOptionalString(f, "label", form.label) ||
                !readOptionalString(f, "kind", kind) ||
                !readOptionalString(f, "segment", form.textureSegment) ||
                !readOptionalString(f, "idleAnimation", form.idleAnimation)) {
                reject("alternateForms", id);
                continue;
            }
            form.kind = kind == "texture" ? AlternateForm::Kind::Texture : AlternateForm::Kind::Model;
            if ((form.kind == AlternateForm::Kind::Model && form.alias.empty()) ||
                (form.kind == AlternateForm::Kind::Texture && form.textureSegment.empty())) {
                reject("alternateForms", id);
                continue;
            }
            setAlternateForm(id, form);
        }
    }

    if (const Json::Value* companions = table("companions")) {
        for (const auto& id : companions->getMemberNames()) {
            std::vector<std::string> aliases;
            if (!readStringList((*companions)[id], aliases)) {
                reject("companions", id);
                continue;
            }
            setCompanionAliases(id, aliases);
        }
    }

    if (const Json::Value* versions = table("modelVersions")) {
        for (const auto& id : versions->getMemberNames()) {
            const Json::Value& list = (*versions)[id];
            if (!list.isArray()) {
                reject("modelVersions", id);
                continue;
            }
            std::vector<ModelVersion> parsed;
            for (const auto& v : list) {
                ModelVersion mv;
                if (!v.isObject() ||
                    !readOptionalString(v, "label", mv.label) ||
                    !readOptionalString(v, "segment", mv.segment) ||
                    !readOptionalString(v, "idleAnimation", mv.idleAnimation) ||
                    !readOptionalBool(v, "texture", mv.hasTexture) ||
                    mv.segment.empty()) {
                    reject("modelVersions", id);
                    continue;
                }
                if (mv.label.empty()) {
                    mv.label = mv.segment;
                }
                parsed.push_back(mv);
            }
            setModelVersions(id, parsed);
        }
    }

    if (const Json::Value* extras = table("extraModels")) {
        for (const auto& id : extras->getMemberNames()) {
            const Json::Value& list = (*extras)[id];
            if (!list.isArray()) {
                reject("extraModels", id);
                continue;
            }
            std::vector<ExtraModelSpec> parsed;
            for (const auto& e : list) {
                ExtraModelSpec extra;
                if (!e.isObject() ||
                    !readStringList(e["aliases"], extra.aliases) ||
                    (e.isMember("offset") && !readVec3(e["offset"], extra.positionOffset)) ||
                    !readOptionalFloat(e, "scale", extra.scaleMultiplier) ||
                    !(extra.scaleMultiplier > 0.0f)) {
                    reject("extraModels", id);
                    continue;
                }
                parsed.push_back(extra);
            }
            setExtraModels(id, parsed);
        }
    }

    if (const Json::Value* offsets = table("mainModelOffsets")) {
        for (const auto& id : offsets->getMemberNames()) {
            glm::vec3 offset(0.0f);
            if (!readVec3((*offsets)[id], offset)) {
                reject("mainModelOffsets", id);
                continue;
            }
            setMainModelOffset(id, offset);
        }
    }

    if (const Json::Value* idle = table("idleAnimations")) {
        for (const auto& key : idle->getMemberNames()) {
            const Json::Value& clip = (*idle)[key];
            if (!clip.isString()) {
                reject("idleAnimations", key);
                continue;
            }
            setIdleAnimation(Strings::ToLower(key), clip.asString());
        }
    }

    if (const Json::Value* preferred = table("preferredIdleAnimations")) {
        for (const auto& alias : preferred->getMemberNames()) {
            const Json::Value& clip = (*preferred)[alias];
            if (!clip.isString() || clip.asString().empty()) {
                reject("preferredIdleAnimations", alias);
                continue;
            }
            setPreferredIdleAnimation(alias, clip.asString());
        }
    }

    if (const Json::Value* sizes = table("sizeOverrides")) {
        for (const auto& key : sizes->getMemberNames()) {
            const Json::Value& s = (*sizes)[key];
            SizeOverride o;
            if (!s.isObject() ||
                !readOptionalFloat(s, "scale", o.scale) ||
                !readOptionalFloat(s, "xShift", o.xShift) ||
                !readOptionalFloat(s, "yShift", o.yShift) ||
                !readOptionalFloat(s, "zShift", o.zShift) ||
                !(o.scale > 0.0f) || !std::isfinite(o.scale)) {
                reject("sizeOverrides", key);
                continue;
            }
            setSizeOverride(Strings::ToLower(key), o);
        }
    }

    if (const Json::Value* scales = table("championScales")) {
        for (const auto& alias : scales->getMemberNames()) {
            const Json::Value& s = (*scales)[alias];
            if (!s.isNumeric() || !(s.asFloat() > 0.0f)) {
                reject("championScales", alias);
                continue;
            }
            setChampionScale(Strings::ToLower(alias), s.asFloat());
        }
    }

    return clean;
}

const AlternateForm* AssetCatalog::alternateForm(const std::string& subjectId) const
{
    auto it = m_forms.find(subjectId);
    return it != m_forms.end() ? &it->second : nullptr;
}

const std::vector<std::string>& AssetCatalog::companionAliases(const std::string& subjectId) const
{
    auto it = m_companions.find(subjectId);
    return it != m_companions.end() ? it->second : kNoAliases;
}

const std::vector<ModelVersion>& AssetCatalog::modelVersions(const std::string& subjectId) const
{
    auto it = m_versions.find(subjectId);
    return it != m_versions.end() ? it->second : kNoVersions;
}

const std::vector<ExtraModelSpec>& AssetCatalog::extraModels(const std::string& subjectId) const
{
    auto it = m_extras.find(subjectId);
    return it != m_extras.end() ? it->second : kNoExtras;
}

std::optional<glm::vec3> AssetCatalog::mainModelOffset(const std::string& subjectId) const
{
    auto it = m_mainOffsets.find(subjectId);
    if (it == m_mainOffsets.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> AssetCatalog::defaultIdleAnimation(const std::string& alias, uint32_t skinId) const
{
    const std::string* clip = lookupSpecific(m_idle, alias, skinId, true);
    if (!clip) {
        return std::nullopt;
    }
    return *clip;
}

void AssetCatalog::setPreferredIdleAnimation(const std::string& alias, const std::string& clip)
{
    m_preferredIdle[Strings::ToLower(alias)] = clip;
}

std::optional<std::string> AssetCatalog::preferredIdleAnimation(const std::string& alias) const
{
    auto it = m_preferredIdle.find(Strings::ToLower(alias));
    if (it == m_preferredIdle.end()) {
        return std::nullopt;
    }
    return it->second;
}

SizeOverride AssetCatalog::sizeOverride(const std::string& alias, uint32_t skinId) const
{
    if (const SizeOverride* o = lookupSpecific(m_sizes, alias, skinId, false)) {
        return *o;
    }

    SizeOverride result;
    auto it = m_championScales.find(Strings::ToLower(alias));
    if (it != m_championScales.end()) {
        result.scale = it->second;
    }
    return result;
}

} // namespace Assets
} // namespace CVW
