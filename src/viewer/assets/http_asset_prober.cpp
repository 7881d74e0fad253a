#include "viewer/assets/http_asset_prober.h"
#include "common/logging.h"
#include "common/net/http_client.h"

namespace CVW {
namespace Assets {

void HttpAssetProber::probe(const std::string& url, std::function<void(ProbeOutcome)> done)
{
    if (m_cacheResults) {
        auto it = m_cache.find(url);
        if (it != m_cache.end()) {
            LOG_TRACE(MOD_PROBE, "HEAD {} (cached {})", url, it->second ? "found" : "missing");
            done(it->second ? ProbeOutcome::Found : ProbeOutcome::Missing);
            return;
        }
    }

    m_client.Head(url, [this, url, done = std::move(done)](const HttpResponse& response) {
        if (response.TransportFailed()) {
            LOG_TRACE(MOD_PROBE, "HEAD {} failed: {}", url, response.error);
            done(ProbeOutcome::Missing);
            return;
        }

        bool found = response.Ok();
        if (m_cacheResults) {
            m_cache[url] = found;
        }
        LOG_TRACE(MOD_PROBE, "HEAD {} -> {}", url, response.status);
        done(found ? ProbeOutcome::Found : ProbeOutcome::Missing);
    });
}

} // namespace Assets
} // namespace CVW
