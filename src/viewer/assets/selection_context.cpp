#include "viewer/assets/selection_context.h"
#include "viewer/assets/asset_family.h"
#include "common/util/strings.h"

#include <fmt/format.h>

namespace CVW {
namespace Assets {

std::string SubjectRef::alias() const
{
    return Strings::ToLower(id);
}

bool SelectionContext::hasSelectedVariant() const
{
    struct Visitor {
        bool operator()(const NoVariant&) const { return false; }
        bool operator()(const ChromaVariant&) const { return true; }
        bool operator()(const AlternateFormVariant& v) const { return v.active; }
        bool operator()(const HistoricalVersionVariant&) const { return true; }
        bool operator()(const ExtraModelVariant& v) const { return !v.aliases.empty(); }
    };
    return std::visit(Visitor{}, variant);
}

std::string describe(const SelectionContext& ctx)
{
    struct Visitor {
        std::string operator()(const NoVariant&) const { return "none"; }
        std::string operator()(const ChromaVariant& v) const { return fmt::format("chroma {}", v.chromaId); }
        std::string operator()(const AlternateFormVariant& v) const { return v.active ? "form on" : "form off"; }
        std::string operator()(const HistoricalVersionVariant& v) const { return fmt::format("version {}", v.index); }
        std::string operator()(const ExtraModelVariant& v) const { return "models " + Strings::Join(v.aliases, "|"); }
    };

    std::string text = fmt::format("{}/{} [{}]", ctx.subject.id, ctx.skinId, std::visit(Visitor{}, ctx.variant));
    if (ctx.companionAlias) {
        text += " companion " + *ctx.companionAlias;
    }
    return text;
}

const char* assetFamilyName(AssetFamily family)
{
    switch (family) {
        case AssetFamily::Model: return "model";
        case AssetFamily::ChromaTexture: return "chroma";
        case AssetFamily::CompanionChromaTexture: return "companion-chroma";
        case AssetFamily::AlternateFormModel: return "form-model";
        case AssetFamily::AlternateFormTexture: return "form-texture";
        case AssetFamily::HistoricalVersionModel: return "version-model";
        case AssetFamily::HistoricalVersionTexture: return "version-texture";
        case AssetFamily::CompanionModel: return "companion-model";
        case AssetFamily::ExtraModel: return "extra-model";
        case AssetFamily::SplashArt: return "splash";
        case AssetFamily::LoadingArt: return "loading";
    }
    return "unknown";
}

} // namespace Assets
} // namespace CVW
