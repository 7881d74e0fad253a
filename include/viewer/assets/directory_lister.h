#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace CVW {

class HttpClient;

namespace Assets {

/**
 * IDirectoryLister - File names inside a remote directory.
 *
 * The callback runs exactly once, later or synchronously from inside list()
 * when the listing is already known. Any failure gives an empty list.
 */
class IDirectoryLister {
public:
    virtual ~IDirectoryLister() = default;

    virtual void list(const std::string& directoryUrl, std::function<void(std::vector<std::string>)> done) = 0;
};

// Last resort once every probed candidate misses: list directoryUrl and
// resolve to directoryUrl + whatever pick() chooses from it.
struct ListingFallback {
    std::string directoryUrl;
    std::optional<std::string> (*pick)(const std::vector<std::string>& files) = nullptr;
};

// Body diffuse texture of a chroma: the shortest "*_tx_cm*.png" whose name
// carries no accessory keyword ("wings", "_ult", "mask"...), else the
// shortest "*_tx_cm*.png" of any kind.
std::optional<std::string> pickChromaBodyTexture(const std::vector<std::string>& files);

// File links of an HTML index page, percent-decoded. Query links, absolute
// paths, sub-directories and external URLs are skipped.
std::vector<std::string> parseDirectoryListing(const std::string& html);

// GET-based lister for autoindex pages. Non-empty listings are cached for the
// session; empty ones are asked for again next time.
class HttpDirectoryLister : public IDirectoryLister {
public:
    explicit HttpDirectoryLister(HttpClient& client) : m_client(client) {}

    void list(const std::string& directoryUrl, std::function<void(std::vector<std::string>)> done) override;

    void clearCache() { m_cache.clear(); }
    size_t cachedCount() const { return m_cache.size(); }

private:
    HttpClient& m_client;
    std::map<std::string, std::vector<std::string>> m_cache;
};

} // namespace Assets
} // namespace CVW
