#include "viewer/assets/asset_urls.h"
#include "common/logging.h"
#include "common/util/strings.h"

#include <fmt/format.h>

namespace CVW {
namespace Assets {

namespace {

void stripTrailingSlashes(std::string& host)
{
    Strings::RTrim(host, "/");
}

} // namespace

std::string chromaNumber(uint32_t chromaId)
{
    return fmt::format("{:02d}", chromaId % 1000);
}

AssetUrls::AssetUrls(AssetHosts hosts, UrlTemplates templates)
    : m_hosts(std::move(hosts)), m_templates(std::move(templates))
{
    stripTrailingSlashes(m_hosts.modelHost);
    stripTrailingSlashes(m_hosts.blobHost);
    stripTrailingSlashes(m_hosts.artHost);
    stripTrailingSlashes(m_hosts.mirrorHost);
    stripTrailingSlashes(m_hosts.rawHost);
}

std::string AssetUrls::expand(const std::string& tmpl, const UrlVars& vars) const
{
    std::string out;
    out.reserve(tmpl.size() + 32);

    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        size_t close = tmpl.find('}', open);
        if (close == std::string::npos) {
            LOG_TRACE(MOD_PROBE, "Unterminated placeholder in '{}'", tmpl);
            return {};
        }
        out.append(tmpl, pos, open - pos);

        const std::string name = tmpl.substr(open + 1, close - open - 1);
        std::string value;
        if (name == "modelHost") {
            value = m_hosts.modelHost;
        } else if (name == "blobHost") {
            value = m_hosts.blobHost;
        } else if (name == "artHost") {
            value = m_hosts.artHost;
        } else if (name == "mirrorHost") {
            value = m_hosts.mirrorHost;
        } else if (name == "rawHost") {
            value = m_hosts.rawHost;
        } else if (name == "alias") {
            value = vars.alias;
        } else if (name == "id") {
            value = vars.id;
        } else if (name == "key") {
            value = vars.key != 0 ? std::to_string(vars.key) : std::string();
        } else if (name == "skinId") {
            value = vars.skinId != 0 ? std::to_string(vars.skinId) : std::string();
        } else if (name == "skinNum") {
            value = std::to_string(vars.skinId % 1000);
        } else if (name == "chromaId") {
            value = vars.chromaId ? std::to_string(*vars.chromaId) : std::string();
        } else if (name == "chromaNum") {
            value = vars.chromaId ? chromaNumber(*vars.chromaId) : std::string();
        } else if (name == "segment") {
            value = vars.segment;
        } else {
            LOG_TRACE(MOD_PROBE, "Unknown placeholder {{{}}} in '{}'", name, tmpl);
            return {};
        }

        if (value.empty()) {
            return {};
        }
        out += value;
        pos = close + 1;
    }

    return out;
}

} // namespace Assets
} // namespace CVW
