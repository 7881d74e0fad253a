#include "viewer/assets/fallback_image_loader.h"
#include "common/logging.h"

namespace CVW {
namespace Assets {

FallbackImageLoader::FallbackImageLoader(IImageSource& source, uint64_t timeoutMs)
    : m_source(source)
    , m_timeoutMs(timeoutMs)
    , m_timer([this](Timer*) { onTimeout(); })
    , m_alive(std::make_shared<bool>(true))
{
}

FallbackImageLoader::~FallbackImageLoader()
{
    *m_alive = false;
    m_timer.Stop();
}

std::optional<std::string> FallbackImageLoader::currentUrl() const
{
    if (m_index >= m_urls.size()) {
        return std::nullopt;
    }
    return m_urls[m_index].url;
}

void FallbackImageLoader::setUrls(const std::vector<std::string>& urls)
{
    CandidateList next(urls);
    if (next == m_urls && m_request != 0) {
        return;
    }

    m_timer.Stop();
    m_urls = std::move(next);
    m_index = 0;
    m_done = false;
    m_loaded.reset();

    if (m_urls.empty()) {
        ++m_request;
        finish(std::nullopt);
        return;
    }
    startCurrent();
}

void FallbackImageLoader::startCurrent()
{
    const uint64_t request = ++m_request;
    const std::string url = m_urls[m_index].url;
    LOG_DEBUG(MOD_ART, "Loading art {}/{}: {}", m_index + 1, m_urls.size(), url);

    m_timer.Stop();
    m_timer.Start(m_timeoutMs, false);

    std::weak_ptr<bool> alive = m_alive;
    m_source.load(url, [this, alive, request](ImageLoadOutcome outcome) {
        auto guard = alive.lock();
        if (!guard || !*guard) {
            return;
        }
        onOutcome(request, outcome);
    });
}

void FallbackImageLoader::onOutcome(uint64_t request, ImageLoadOutcome outcome)
{
    if (m_done || request != m_request) {
        LOG_TRACE(MOD_ART, "Ignoring outcome of superseded art request {}", request);
        return;
    }

    if (outcome == ImageLoadOutcome::Loaded) {
        finish(m_urls[m_index].url);
        return;
    }

    LOG_DEBUG(MOD_ART, "Art failed: {}", m_urls[m_index].url);
    advance();
}

void FallbackImageLoader::onTimeout()
{
    if (m_done) {
        return;
    }
    LOG_DEBUG(MOD_ART, "Art timed out after {} ms: {}", m_timeoutMs, m_urls[m_index].url);
    advance();
}

void FallbackImageLoader::advance()
{
    if (m_index + 1 >= m_urls.size()) {
        finish(std::nullopt);
        return;
    }
    ++m_index;
    startCurrent();
}

void FallbackImageLoader::finish(std::optional<std::string> loaded)
{
    if (m_done) {
        return;
    }
    m_timer.Stop();
    m_done = true;
    m_loaded = std::move(loaded);

    if (m_loaded) {
        LOG_DEBUG(MOD_ART, "Art loaded: {}", *m_loaded);
    } else {
        LOG_DEBUG(MOD_ART, "Art exhausted after {} candidates", m_urls.size());
    }

    if (m_listener) {
        m_listener(m_loaded);
    }
}

} // namespace Assets
} // namespace CVW
