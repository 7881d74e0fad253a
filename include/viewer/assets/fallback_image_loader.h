#pragma once

#include "common/event/timer.h"
#include "viewer/assets/candidate_list.h"
#include "viewer/assets/image_source.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CVW {
namespace Assets {

constexpr uint64_t kDefaultArtLoadTimeoutMs = 4000;

/**
 * FallbackImageLoader - Loads the first URL of a list that actually produces
 * an image, moving on when a load fails or takes longer than the timeout.
 *
 * The listener is told exactly once per list: with the URL that loaded, or
 * with nullopt when every URL failed. Setting a list equal by value to the
 * current one keeps the current state; any other list starts over.
 */
class FallbackImageLoader {
public:
    using Listener = std::function<void(const std::optional<std::string>& loadedUrl)>;

    explicit FallbackImageLoader(IImageSource& source, uint64_t timeoutMs = kDefaultArtLoadTimeoutMs);
    ~FallbackImageLoader();

    FallbackImageLoader(const FallbackImageLoader&) = delete;
    FallbackImageLoader& operator=(const FallbackImageLoader&) = delete;

    void setUrls(const std::vector<std::string>& urls);
    void setListener(Listener listener) { m_listener = std::move(listener); }

    bool isDone() const { return m_done; }
    size_t currentIndex() const { return m_index; }
    size_t urlCount() const { return m_urls.size(); }
    std::optional<std::string> currentUrl() const;
    const std::optional<std::string>& loadedUrl() const { return m_loaded; }

private:
    void startCurrent();
    void onOutcome(uint64_t request, ImageLoadOutcome outcome);
    void onTimeout();
    void advance();
    void finish(std::optional<std::string> loaded);

    IImageSource& m_source;
    uint64_t m_timeoutMs;
    CandidateList m_urls;
    size_t m_index = 0;
    bool m_done = false;
    uint64_t m_request = 0;
    std::optional<std::string> m_loaded;
    Listener m_listener;
    Timer m_timer;
    std::shared_ptr<bool> m_alive;
};

} // namespace Assets
} // namespace CVW
