#pragma once

#include "common/util/json_config.h"
#include "viewer/assets/asset_catalog.h"
#include "viewer/assets/asset_urls.h"
#include "viewer/graphics/model_normalizer.h"

#include <cstdint>
#include <string>

namespace CVW {

struct ProbeSettings {
    long timeoutMs = 15000;
    bool cacheResults = true;
};

struct ArtSettings {
    uint64_t loadTimeoutMs = 4000;
};

/**
 * ViewerConfig - Settings for the resolution engine and the render surface,
 * read from one JSON file.
 *
 * Sections: "hosts", "urlTemplates", "probe", "art", "normalizer",
 * "catalog" and "logging". Anything missing keeps its default; numbers out
 * of range are clamped with a warning.
 */
class ViewerConfig {
public:
    ViewerConfig();

    // Missing file: defaults, returns true. Malformed file: defaults,
    // returns false.
    bool load(const std::string& path);
    bool loadFromString(const std::string& contents);

    // Applies the "logging" section to the LogManager.
    void applyLogging() const;

    const Assets::AssetHosts& hosts() const { return hosts_; }
    const Assets::UrlTemplates& urlTemplates() const { return templates_; }
    const ProbeSettings& probe() const { return probe_; }
    const ArtSettings& art() const { return art_; }
    const Graphics::NormalizerSettings& normalizer() const { return normalizer_; }
    const Assets::AssetCatalog& catalog() const { return catalog_; }

    const std::string& path() const { return path_; }

private:
    bool apply(const JsonConfigFile& file);
    void loadHosts(const JsonConfigFile& file);
    void loadTemplates(const JsonConfigFile& file);
    void loadProbe(const JsonConfigFile& file);
    void loadArt(const JsonConfigFile& file);
    void loadNormalizer(const JsonConfigFile& file);

    static float clampFloat(float value, float minVal, float maxVal, const char* name);
    static int clampInt(int value, int minVal, int maxVal, const char* name);

    Assets::AssetHosts hosts_;
    Assets::UrlTemplates templates_;
    ProbeSettings probe_;
    ArtSettings art_;
    Graphics::NormalizerSettings normalizer_;
    Assets::AssetCatalog catalog_;
    Json::Value logging_;
    std::string path_;
};

} // namespace CVW
