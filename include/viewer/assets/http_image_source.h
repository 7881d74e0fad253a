#pragma once

#include "viewer/assets/image_source.h"

#include <map>
#include <string>

namespace CVW {

class HttpClient;

namespace Assets {

// Fetches images with GET and keeps the bytes of successful downloads so
// the render surface can decode the one that won.
class HttpImageSource : public IImageSource {
public:
    explicit HttpImageSource(HttpClient& client) : m_client(client) {}

    void load(const std::string& url, std::function<void(ImageLoadOutcome)> done) override;

    // Downloaded bytes for url, or nullptr if it never loaded.
    const std::string* bytes(const std::string& url) const;
    void forget(const std::string& url) { m_bytes.erase(url); }

private:
    HttpClient& m_client;
    std::map<std::string, std::string> m_bytes;
};

} // namespace Assets
} // namespace CVW
