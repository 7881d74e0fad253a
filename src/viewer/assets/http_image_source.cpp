#include "viewer/assets/http_image_source.h"
#include "common/logging.h"
#include "common/net/http_client.h"

namespace CVW {
namespace Assets {

void HttpImageSource::load(const std::string& url, std::function<void(ImageLoadOutcome)> done)
{
    if (m_bytes.count(url) != 0) {
        done(ImageLoadOutcome::Loaded);
        return;
    }

    m_client.Get(url, [this, url, done = std::move(done)](const HttpResponse& response) {
        if (!response.Ok() || response.body.empty()) {
            LOG_TRACE(MOD_ART, "GET {} failed: status {} {}", url, response.status, response.error);
            done(ImageLoadOutcome::Failed);
            return;
        }
        m_bytes[url] = response.body;
        done(ImageLoadOutcome::Loaded);
    });
}

const std::string* HttpImageSource::bytes(const std::string& url) const
{
    auto it = m_bytes.find(url);
    return it != m_bytes.end() ? &it->second : nullptr;
}

} // namespace Assets
} // namespace CVW
