#include "viewer/assets/chroma_list.h"
#include "common/logging.h"
#include "common/net/http_client.h"

#include <sstream>

namespace CVW {
namespace Assets {

namespace {

bool readId(const Json::Value& entry, uint32_t& id)
{
    if (!entry.isObject() || !entry["id"].isUInt()) {
        return false;
    }
    id = entry["id"].asUInt();
    return true;
}

} // namespace

bool parseChromaList(const Json::Value& root, SkinChromaMap& out)
{
    if (!root.isObject() || !root["skins"].isArray()) {
        return false;
    }

    for (const auto& skin : root["skins"]) {
        uint32_t skinId = 0;
        if (!readId(skin, skinId) || !skin["chromas"].isArray()) {
            continue;
        }

        std::vector<ChromaInfo> chromas;
        for (const auto& entry : skin["chromas"]) {
            ChromaInfo chroma;
            if (!readId(entry, chroma.id)) {
                continue;
            }
            if (entry["name"].isString()) {
                chroma.name = entry["name"].asString();
            }
            if (entry["colors"].isArray()) {
                for (const auto& color : entry["colors"]) {
                    if (color.isString()) {
                        chroma.colors.push_back(color.asString());
                    }
                }
            }
            chromas.push_back(std::move(chroma));
        }

        if (!chromas.empty()) {
            out[skinId] = std::move(chromas);
        }
    }
    return true;
}

bool parseChromaList(const std::string& text, SkinChromaMap& out)
{
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    Json::Value root;
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        LOG_DEBUG(MOD_VARIANT, "Chroma list is not valid JSON: {}", errors);
        return false;
    }
    return parseChromaList(root, out);
}

void HttpChromaListSource::fetch(const SubjectRef& subject, std::function<void(std::optional<SkinChromaMap>)> done)
{
    UrlVars vars;
    vars.id = subject.id;
    vars.key = subject.key;
    vars.alias = subject.alias();
    const std::string url = m_urls.expand(m_urls.templates().chromaList, vars);
    if (url.empty()) {
        LOG_DEBUG(MOD_VARIANT, "No chroma list URL for {}", subject.id);
        done(std::nullopt);
        return;
    }

    m_client.Get(url, [url, done = std::move(done)](const HttpResponse& response) {
        if (!response.Ok()) {
            LOG_WARN(MOD_VARIANT, "Chroma list {} failed: status {} {}", url, response.status, response.error);
            done(std::nullopt);
            return;
        }
        SkinChromaMap chromas;
        if (!parseChromaList(response.body, chromas)) {
            LOG_WARN(MOD_VARIANT, "Chroma list {} could not be parsed", url);
            done(std::nullopt);
            return;
        }
        LOG_DEBUG(MOD_VARIANT, "Chroma list {}: {} skins with chromas", url, chromas.size());
        done(std::move(chromas));
    });
}

} // namespace Assets
} // namespace CVW
