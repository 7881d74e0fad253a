#pragma once

#include "viewer/assets/asset_urls.h"
#include "viewer/assets/selection_context.h"

#include <json/json.h>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace CVW {

class HttpClient;

namespace Assets {

struct ChromaInfo {
    uint32_t id = 0;
    std::string name;
    std::vector<std::string> colors;  // "#RRGGBB", usually two

    bool operator==(const ChromaInfo& other) const
    {
        return id == other.id && name == other.name && colors == other.colors;
    }
};

// skin id -> chromas offered for it, in catalog order. Skins without
// chromas have no entry.
using SkinChromaMap = std::map<uint32_t, std::vector<ChromaInfo>>;

/**
 * Fill out from a character data document:
 *
 *   { "skins": [ { "id": 1001, "chromas": [ { "id": 1012, "name": "...",
 *                                              "colors": ["#..."] } ] } ] }
 *
 * Returns false when the document has no "skins" array. Skins or chromas
 * without an integral id are skipped; a missing name or colors is left empty.
 */
bool parseChromaList(const Json::Value& root, SkinChromaMap& out);

// Same, from the document text. Malformed JSON returns false.
bool parseChromaList(const std::string& text, SkinChromaMap& out);

/**
 * IChromaListSource - Chromas on offer for every skin of a character.
 *
 * The callback runs exactly once, with nullopt when the list could not be
 * fetched or parsed.
 */
class IChromaListSource {
public:
    virtual ~IChromaListSource() = default;

    virtual void fetch(const SubjectRef& subject, std::function<void(std::optional<SkinChromaMap>)> done) = 0;
};

// GET of the chromaList template for the subject's key
class HttpChromaListSource : public IChromaListSource {
public:
    HttpChromaListSource(HttpClient& client, const AssetUrls& urls) : m_client(client), m_urls(urls) {}

    void fetch(const SubjectRef& subject, std::function<void(std::optional<SkinChromaMap>)> done) override;

private:
    HttpClient& m_client;
    const AssetUrls& m_urls;
};

} // namespace Assets
} // namespace CVW
