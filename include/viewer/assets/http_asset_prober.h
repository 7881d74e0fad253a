#pragma once

#include "viewer/assets/asset_prober.h"

#include <map>
#include <string>

namespace CVW {

class HttpClient;

namespace Assets {

// HEAD-request prober. With caching on, every status answer (found or not)
// is remembered for the rest of the session; transport errors are not.
class HttpAssetProber : public IAssetProber {
public:
    HttpAssetProber(HttpClient& client, bool cacheResults = true)
        : m_client(client), m_cacheResults(cacheResults) {}

    void probe(const std::string& url, std::function<void(ProbeOutcome)> done) override;

    void clearCache() { m_cache.clear(); }
    size_t cachedCount() const { return m_cache.size(); }

private:
    HttpClient& m_client;
    bool m_cacheResults;
    std::map<std::string, bool> m_cache;
};

} // namespace Assets
} // namespace CVW
