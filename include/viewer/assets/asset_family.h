#pragma once

namespace CVW {
namespace Assets {

enum class AssetFamily {
    Model,
    ChromaTexture,
    CompanionChromaTexture,
    AlternateFormModel,
    AlternateFormTexture,
    HistoricalVersionModel,
    HistoricalVersionTexture,
    CompanionModel,
    ExtraModel,
    SplashArt,
    LoadingArt
};

const char* assetFamilyName(AssetFamily family);

} // namespace Assets
} // namespace CVW
