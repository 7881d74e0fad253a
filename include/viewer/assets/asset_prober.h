#pragma once

#include <functional>
#include <string>

namespace CVW {
namespace Assets {

enum class ProbeOutcome { Found, Missing };

/**
 * IAssetProber - Existence check for a single URL.
 *
 * The callback runs exactly once, either later from the event loop or
 * synchronously from inside probe() when the answer is already known.
 * Transport failures are reported as Missing.
 */
class IAssetProber {
public:
    virtual ~IAssetProber() = default;

    virtual void probe(const std::string& url, std::function<void(ProbeOutcome)> done) = 0;
};

} // namespace Assets
} // namespace CVW
