#include "viewer/viewer_config.h"
#include "common/logging.h"

#include <algorithm>

namespace CVW {

ViewerConfig::ViewerConfig()
    : catalog_(Assets::AssetCatalog::defaults())
{
}

bool ViewerConfig::load(const std::string& path) {
    path_ = path;
    JsonConfigFile file = JsonConfigFile::Load(path);
    if (!file.Ok()) {
        return false;
    }
    if (!file.Exists()) {
        return true;
    }
    LOG_INFO(MOD_CONFIG, "Loaded config {}", path);
    return apply(file);
}

bool ViewerConfig::loadFromString(const std::string& contents) {
    JsonConfigFile file = JsonConfigFile::Parse(contents);
    if (!file.Ok()) {
        LOG_ERROR(MOD_CONFIG, "Failed to parse config: {}", file.Error());
        return false;
    }
    return apply(file);
}

bool ViewerConfig::apply(const JsonConfigFile& file) {
    loadHosts(file);
    loadTemplates(file);
    loadProbe(file);
    loadArt(file);
    loadNormalizer(file);

    logging_ = file.RawHandle().get("logging", Json::Value());

    // A bad catalog entry is skipped; the rest of the file still applies.
    catalog_.loadJson(file.RawHandle().get("catalog", Json::Value()));
    return true;
}

void ViewerConfig::applyLogging() const {
    if (logging_.isNull()) {
        return;
    }
    Json::Value wrapper(Json::objectValue);
    wrapper["logging"] = logging_;
    InitLoggingFromJson(wrapper);
}

float ViewerConfig::clampFloat(float value, float minVal, float maxVal, const char* name) {
    if (value < minVal || value > maxVal) {
        float clamped = std::clamp(value, minVal, maxVal);
        LOG_WARN(MOD_CONFIG, "ViewerConfig: '{}' value {} clamped to [{}, {}] -> {}",
                 name, value, minVal, maxVal, clamped);
        return clamped;
    }
    return value;
}

int ViewerConfig::clampInt(int value, int minVal, int maxVal, const char* name) {
    if (value < minVal || value > maxVal) {
        int clamped = std::clamp(value, minVal, maxVal);
        LOG_WARN(MOD_CONFIG, "ViewerConfig: '{}' value {} clamped to [{}, {}] -> {}",
                 name, value, minVal, maxVal, clamped);
        return clamped;
    }
    return value;
}

void ViewerConfig::loadHosts(const JsonConfigFile& file) {
    hosts_.modelHost = file.GetVariableString("hosts", "modelHost", hosts_.modelHost);
    hosts_.blobHost = file.GetVariableString("hosts", "blobHost", hosts_.blobHost);
    hosts_.artHost = file.GetVariableString("hosts", "artHost", hosts_.artHost);
    hosts_.mirrorHost = file.GetVariableString("hosts", "mirrorHost", hosts_.mirrorHost);
    hosts_.rawHost = file.GetVariableString("hosts", "rawHost", hosts_.rawHost);

    if (hosts_.modelHost.empty()) {
        LOG_WARN(MOD_CONFIG, "ViewerConfig: 'hosts.modelHost' is empty, no model will resolve");
    }
}

void ViewerConfig::loadTemplates(const JsonConfigFile& file) {
    struct Entry {
        const char* name;
        std::string* value;
    };
    const Entry entries[] = {
        {"model", &templates_.model},
        {"versionModel", &templates_.versionModel},
        {"versionTexture", &templates_.versionTexture},
        {"formTexture", &templates_.formTexture},
        {"chromaBlob", &templates_.chromaBlob},
        {"chromaMirror", &templates_.chromaMirror},
        {"chromaMirrorBase", &templates_.chromaMirrorBase},
        {"chromaListing", &templates_.chromaListing},
        {"chromaList", &templates_.chromaList},
        {"splash", &templates_.splash},
        {"splashMirror", &templates_.splashMirror},
        {"loading", &templates_.loading},
        {"loadingMirror", &templates_.loadingMirror},
    };
    for (const auto& e : entries) {
        *e.value = file.GetVariableString("urlTemplates", e.name, *e.value);
    }
}

void ViewerConfig::loadProbe(const JsonConfigFile& file) {
    probe_.timeoutMs = clampInt(file.GetVariableInt("probe", "timeoutMs", static_cast<int>(probe_.timeoutMs)),
                                500, 60000, "probe.timeoutMs");
    probe_.cacheResults = file.GetVariableBool("probe", "cacheResults", probe_.cacheResults);
}

void ViewerConfig::loadArt(const JsonConfigFile& file) {
    art_.loadTimeoutMs = static_cast<uint64_t>(
        clampInt(file.GetVariableInt("art", "loadTimeoutMs", static_cast<int>(art_.loadTimeoutMs)),
                 250, 30000, "art.loadTimeoutMs"));
}

void ViewerConfig::loadNormalizer(const JsonConfigFile& file) {
    Graphics::NormalizerSettings& n = normalizer_;
    n.targetHeight = clampFloat(static_cast<float>(file.GetVariableDouble("normalizer", "targetHeight", n.targetHeight)),
                                0.1f, 100.0f, "normalizer.targetHeight");
    n.baselineY = clampFloat(static_cast<float>(file.GetVariableDouble("normalizer", "baselineY", n.baselineY)),
                             -100.0f, 100.0f, "normalizer.baselineY");
    n.minHeight = clampFloat(static_cast<float>(file.GetVariableDouble("normalizer", "minHeight", n.minHeight)),
                             0.0001f, 1.0f, "normalizer.minHeight");
    n.groundJoint = file.GetVariableString("normalizer", "groundJoint", n.groundJoint);
    n.overheadJoint = file.GetVariableString("normalizer", "overheadJoint", n.overheadJoint);
    n.useBodyJoints = file.GetVariableBool("normalizer", "useBodyJoints", n.useBodyJoints);
    n.minBodyJoints = static_cast<size_t>(clampInt(
        file.GetVariableInt("normalizer", "minBodyJoints", static_cast<int>(n.minBodyJoints)),
        1, 1000, "normalizer.minBodyJoints"));
    n.iqrFactor = clampFloat(static_cast<float>(file.GetVariableDouble("normalizer", "iqrFactor", n.iqrFactor)),
                             0.0f, 10.0f, "normalizer.iqrFactor");
}

} // namespace CVW
