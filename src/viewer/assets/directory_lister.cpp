#include "viewer/assets/directory_lister.h"
#include "common/logging.h"
#include "common/net/http_client.h"
#include "common/util/strings.h"

#include <algorithm>
#include <regex>

namespace CVW {
namespace Assets {

namespace {

// Substrings that mark a texture as something other than the body
const char* const kAccessoryKeywords[] = {
    "sword", "wings", "wing", "banner", "recall", "_ult", "vfx",
    "mask", "particle", "weapon", "shield", "cape", "hair", "tail",
    "loadscreen", "materialmask",
};

bool hasAccessoryKeyword(const std::string& lowered)
{
    return std::any_of(std::begin(kAccessoryKeywords), std::end(kAccessoryKeywords),
                       [&lowered](const char* kw) { return lowered.find(kw) != std::string::npos; });
}

int hexValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Malformed escapes are kept as written
std::string percentDecode(const std::string& in)
{
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = hexValue(in[i + 1]);
            const int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

bool startsWith(const std::string& s, const char* prefix)
{
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

} // namespace

std::optional<std::string> pickChromaBodyTexture(const std::vector<std::string>& files)
{
    std::vector<std::string> textures;
    std::vector<std::string> body;
    for (const auto& f : files) {
        const std::string lowered = Strings::ToLower(f);
        if (lowered.size() < 4 || lowered.compare(lowered.size() - 4, 4, ".png") != 0 ||
            lowered.find("_tx_cm") == std::string::npos) {
            continue;
        }
        textures.push_back(f);
        if (!hasAccessoryKeyword(lowered)) {
            body.push_back(f);
        }
    }

    const std::vector<std::string>& pool = body.empty() ? textures : body;
    if (pool.empty()) {
        return std::nullopt;
    }
    // First of the shortest names
    return *std::min_element(pool.begin(), pool.end(), [](const std::string& a, const std::string& b) {
        return a.size() < b.size();
    });
}

std::vector<std::string> parseDirectoryListing(const std::string& html)
{
    static const std::regex link("<a\\s+href=\"([^\"]+)\"", std::regex::icase);

    std::vector<std::string> files;
    for (auto it = std::sregex_iterator(html.begin(), html.end(), link); it != std::sregex_iterator(); ++it) {
        const std::string href = (*it)[1].str();
        if (startsWith(href, "?") || startsWith(href, "/") || href.back() == '/') {
            continue;
        }
        if (startsWith(href, "http://") || startsWith(href, "https://")) {
            continue;
        }
        files.push_back(percentDecode(href));
    }
    return files;
}

void HttpDirectoryLister::list(const std::string& directoryUrl, std::function<void(std::vector<std::string>)> done)
{
    auto it = m_cache.find(directoryUrl);
    if (it != m_cache.end()) {
        LOG_TRACE(MOD_PROBE, "Listing {} (cached, {} files)", directoryUrl, it->second.size());
        done(it->second);
        return;
    }

    m_client.Get(directoryUrl, [this, directoryUrl, done = std::move(done)](const HttpResponse& response) {
        if (!response.Ok()) {
            LOG_DEBUG(MOD_PROBE, "Listing {} failed: status {} {}", directoryUrl, response.status, response.error);
            done({});
            return;
        }
        std::vector<std::string> files = parseDirectoryListing(response.body);
        LOG_DEBUG(MOD_PROBE, "Listing {}: {} files", directoryUrl, files.size());
        if (!files.empty()) {
            m_cache[directoryUrl] = files;
        }
        done(std::move(files));
    });
}

} // namespace Assets
} // namespace CVW
