#pragma once

#include <functional>
#include <string>

namespace CVW {
namespace Assets {

enum class ImageLoadOutcome { Loaded, Failed };

// Something that can fetch and decode an image by URL. The callback runs at
// most once per load() call.
class IImageSource {
public:
    virtual ~IImageSource() = default;

    virtual void load(const std::string& url, std::function<void(ImageLoadOutcome)> done) = 0;
};

} // namespace Assets
} // namespace CVW
