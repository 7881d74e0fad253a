#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace CVW {
namespace Assets {

struct AssetHosts {
    std::string modelHost = "https://cdn.modelviewer.lol";
    std::string blobHost;                                     // empty: no blob store
    std::string artHost = "https://ddragon.leagueoflegends.com";
    std::string mirrorHost = "https://cdn.communitydragon.org";
    std::string rawHost = "https://raw.communitydragon.org";
};

struct UrlTemplates {
    std::string model = "{modelHost}/lol/models/{alias}/{skinId}/model.glb";
    std::string versionModel = "{modelHost}/lol/models/{alias}/{skinId}/{segment}/model.glb";
    std::string versionTexture = "{modelHost}/lol/models/{alias}/{skinId}/{segment}/texture.webp";
    std::string formTexture = "{modelHost}/lol/models/{alias}/{skinId}/{segment}.webp";
    std::string chromaBlob = "{blobHost}/chromas/{alias}/skin{chromaNum}.webp";
    std::string chromaMirror =
        "{rawHost}/latest/game/assets/characters/{alias}/skins/skin{chromaNum}/{alias}_skin{chromaNum}_tx_cm.png";
    std::string chromaMirrorBase =
        "{rawHost}/latest/game/assets/characters/{alias}/skins/skin{chromaNum}/{alias}_tx_cm.png";
    std::string chromaListing = "{rawHost}/latest/game/assets/characters/{alias}/skins/skin{chromaNum}/";
    std::string chromaList =
        "{rawHost}/latest/plugins/rcp-be-lol-game-data/global/default/v1/champions/{key}.json";
    std::string splash = "{artHost}/cdn/img/champion/splash/{id}_{skinNum}.jpg";
    std::string splashMirror = "{mirrorHost}/latest/champion/{key}/splash-art/skin/{skinNum}";
    std::string loading = "{artHost}/cdn/img/champion/loading/{id}_{skinNum}.jpg";
    std::string loadingMirror = "{mirrorHost}/latest/champion/{key}/tile/skin/{skinNum}";
};

// Values substituted into a template. Unset optional values leave their
// placeholders unresolved, which makes the expansion fail.
struct UrlVars {
    std::string id;
    std::string alias;
    uint32_t key = 0;
    uint32_t skinId = 0;
    std::optional<uint32_t> chromaId;
    std::string segment;
};

/**
 * AssetUrls - Expands {placeholder} URL templates against the configured hosts.
 *
 * expand() returns an empty string when the template names a host that is
 * not configured, a variable that is not set, or an unknown placeholder.
 * Empty results are dropped by CandidateList, which is how an unset blob
 * host removes the blob candidate.
 */
class AssetUrls {
public:
    AssetUrls() = default;
    AssetUrls(AssetHosts hosts, UrlTemplates templates);

    std::string expand(const std::string& tmpl, const UrlVars& vars) const;

    const AssetHosts& hosts() const { return m_hosts; }
    const UrlTemplates& templates() const { return m_templates; }

private:
    AssetHosts m_hosts;
    UrlTemplates m_templates;
};

// "12" style two digit skin number of a chroma id
std::string chromaNumber(uint32_t chromaId);

} // namespace Assets
} // namespace CVW
