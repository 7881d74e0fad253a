#include "viewer/assets/snapshot_json.h"

namespace CVW {
namespace Assets {

namespace {

Json::Value optionalString(const std::optional<std::string>& value)
{
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Json::Value vec3(const glm::vec3& v)
{
    Json::Value out(Json::arrayValue);
    out.append(v.x);
    out.append(v.y);
    out.append(v.z);
    return out;
}

} // namespace

Json::Value snapshotToJson(const RenderSnapshot& s)
{
    Json::Value root(Json::objectValue);
    root["champion"] = s.subject.id;
    root["key"] = s.subject.key;
    root["skinId"] = s.skinId;
    root["chromaId"] = s.chromaId ? Json::Value(*s.chromaId) : Json::Value(Json::nullValue);

    root["modelUrl"] = s.modelUrl;
    root["modelAlias"] = s.modelAlias;
    root["modelSkinId"] = s.modelSkinId;
    root["textureUrl"] = optionalString(s.textureUrl);
    root["companionModelUrl"] = optionalString(s.companionModelUrl);
    root["companionTextureUrl"] = optionalString(s.companionTextureUrl);

    Json::Value extras(Json::arrayValue);
    for (const auto& extra : s.extraModels) {
        Json::Value e(Json::objectValue);
        e["url"] = extra.url;
        e["offset"] = vec3(extra.positionOffset);
        e["scale"] = extra.scaleMultiplier;
        extras.append(e);
    }
    root["extraModels"] = extras;
    root["mainModelOffset"] = s.mainModelOffset ? vec3(*s.mainModelOffset) : Json::Value(Json::nullValue);

    root["idleOverride"] = optionalString(s.idleOverride);
    root["preferredIdle"] = optionalString(s.preferredIdle);
    root["defaultIdle"] = optionalString(s.defaultIdle);

    Json::Value chromas(Json::arrayValue);
    for (const auto& chroma : s.chromas) {
        Json::Value c(Json::objectValue);
        c["id"] = chroma.id;
        c["name"] = chroma.name;
        Json::Value colors(Json::arrayValue);
        for (const auto& color : chroma.colors) {
            colors.append(color);
        }
        c["colors"] = colors;
        chromas.append(c);
    }
    root["chromas"] = chromas;
    root["chromaListLoading"] = s.chromaListLoading;

    Json::Value form(Json::objectValue);
    form["active"] = s.alternateFormActive;
    form["offered"] = s.offersAlternateForm;
    form["label"] = optionalString(s.alternateFormLabel);
    root["alternateForm"] = form;

    Json::Value versions(Json::objectValue);
    Json::Value labels(Json::arrayValue);
    for (const auto& label : s.versionLabels) {
        labels.append(label);
    }
    versions["labels"] = labels;
    versions["index"] = s.versionIndex;
    versions["next"] = s.nextVersionLabel;
    versions["offered"] = s.offersVersions;
    root["versions"] = versions;

    root["chromaResolving"] = s.chromaResolving;
    root["settled"] = s.settled;
    return root;
}

} // namespace Assets
} // namespace CVW
