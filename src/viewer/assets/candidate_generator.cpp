#include "viewer/assets/candidate_generator.h"
#include "common/logging.h"

namespace CVW {
namespace Assets {

namespace {

UrlVars varsFor(const SubjectRef& subject, const std::string& alias, uint32_t skinId)
{
    UrlVars vars;
    vars.id = subject.id;
    vars.alias = alias;
    vars.key = subject.key;
    vars.skinId = skinId;
    return vars;
}

} // namespace

std::string CandidateGenerator::modelUrl(const std::string& alias, uint32_t skinId) const
{
    UrlVars vars;
    vars.alias = alias;
    vars.skinId = skinId;
    return m_urls.expand(m_urls.templates().model, vars);
}

void CandidateGenerator::chromaCandidates(CandidateList& out, const std::string& alias, uint32_t chromaId) const
{
    UrlVars vars;
    vars.alias = alias;
    vars.chromaId = chromaId;

    const UrlTemplates& t = m_urls.templates();
    out.push(m_urls.expand(t.chromaBlob, vars));
    out.push(m_urls.expand(t.chromaMirror, vars));
    out.push(m_urls.expand(t.chromaMirrorBase, vars));
}

void CandidateGenerator::aliasModelCandidates(CandidateList& out, const std::vector<std::string>& aliases,
                                              uint32_t skinId) const
{
    for (uint32_t skin : {skinId, baseSkinIdOf(skinId)}) {
        for (const auto& alias : aliases) {
            out.push(modelUrl(alias, skin));
        }
    }
}

void CandidateGenerator::artCandidates(CandidateList& out, const SelectionContext& ctx,
                                       const std::string& primary, const std::string& mirror) const
{
    const std::string alias = ctx.subject.alias();
    for (uint32_t skin : {ctx.skinId, ctx.baseSkinId()}) {
        UrlVars vars = varsFor(ctx.subject, alias, skin);
        out.push(m_urls.expand(primary, vars));
        out.push(m_urls.expand(mirror, vars));
    }
}

std::optional<ListingFallback> CandidateGenerator::listingFallback(const SelectionContext& ctx,
                                                                  AssetFamily family) const
{
    const auto* chroma = std::get_if<ChromaVariant>(&ctx.variant);
    if (ctx.empty() || !chroma) {
        return std::nullopt;
    }

    UrlVars vars;
    vars.chromaId = chroma->chromaId;
    if (family == AssetFamily::ChromaTexture) {
        vars.alias = ctx.subject.alias();
    } else if (family == AssetFamily::CompanionChromaTexture && ctx.companionAlias && !ctx.companionAlias->empty()) {
        vars.alias = *ctx.companionAlias;
    } else {
        return std::nullopt;
    }

    std::string directory = m_urls.expand(m_urls.templates().chromaListing, vars);
    if (directory.empty()) {
        return std::nullopt;
    }
    if (directory.back() != '/') {
        directory += '/';
    }
    return ListingFallback{directory, &pickChromaBodyTexture};
}

CandidateList CandidateGenerator::generate(const SelectionContext& ctx, AssetFamily family) const
{
    CandidateList out;
    if (ctx.empty() || ctx.skinId == 0) {
        return out;
    }

    const UrlTemplates& t = m_urls.templates();
    const std::string alias = ctx.subject.alias();

    switch (family) {
        case AssetFamily::Model:
            out.push(modelUrl(alias, ctx.skinId));
            break;

        case AssetFamily::ChromaTexture:
            if (const auto* chroma = std::get_if<ChromaVariant>(&ctx.variant)) {
                chromaCandidates(out, alias, chroma->chromaId);
            }
            break;

        case AssetFamily::CompanionChromaTexture:
            if (const auto* chroma = std::get_if<ChromaVariant>(&ctx.variant)) {
                if (ctx.companionAlias && !ctx.companionAlias->empty()) {
                    chromaCandidates(out, *ctx.companionAlias, chroma->chromaId);
                }
            }
            break;

        case AssetFamily::AlternateFormModel: {
            const auto* form = std::get_if<AlternateFormVariant>(&ctx.variant);
            const AlternateForm* def = m_catalog.alternateForm(ctx.subject.id);
            if (form && form->active && def && def->kind == AlternateForm::Kind::Model) {
                aliasModelCandidates(out, {def->alias}, ctx.skinId);
            }
            break;
        }

        case AssetFamily::AlternateFormTexture: {
            const auto* form = std::get_if<AlternateFormVariant>(&ctx.variant);
            const AlternateForm* def = m_catalog.alternateForm(ctx.subject.id);
            if (form && form->active && def && def->kind == AlternateForm::Kind::Texture) {
                for (uint32_t skin : {ctx.skinId, ctx.baseSkinId()}) {
                    UrlVars vars = varsFor(ctx.subject, alias, skin);
                    vars.segment = def->textureSegment;
                    out.push(m_urls.expand(t.formTexture, vars));
                }
            }
            break;
        }

        case AssetFamily::HistoricalVersionModel:
        case AssetFamily::HistoricalVersionTexture: {
            const auto* version = std::get_if<HistoricalVersionVariant>(&ctx.variant);
            const auto& versions = m_catalog.modelVersions(ctx.subject.id);
            if (!version || version->index >= versions.size()) {
                break;
            }
            const ModelVersion& def = versions[version->index];
            if (family == AssetFamily::HistoricalVersionTexture && !def.hasTexture) {
                break;
            }
            const std::string& tmpl = family == AssetFamily::HistoricalVersionModel
                ? t.versionModel : t.versionTexture;
            for (uint32_t skin : {ctx.skinId, ctx.baseSkinId()}) {
                UrlVars vars = varsFor(ctx.subject, alias, skin);
                vars.segment = def.segment;
                out.push(m_urls.expand(tmpl, vars));
            }
            break;
        }

        case AssetFamily::CompanionModel: {
            std::vector<std::string> aliases;
            if (ctx.companionAlias && !ctx.companionAlias->empty()) {
                aliases.push_back(*ctx.companionAlias);
            }
            if (const auto* extra = std::get_if<ExtraModelVariant>(&ctx.variant)) {
                aliases.insert(aliases.end(), extra->aliases.begin(), extra->aliases.end());
            }
            aliasModelCandidates(out, aliases, ctx.skinId);
            break;
        }

        case AssetFamily::ExtraModel:
            if (const auto* extra = std::get_if<ExtraModelVariant>(&ctx.variant)) {
                aliasModelCandidates(out, extra->aliases, ctx.skinId);
            }
            break;

        case AssetFamily::SplashArt:
            artCandidates(out, ctx, t.splash, t.splashMirror);
            break;

        case AssetFamily::LoadingArt:
            artCandidates(out, ctx, t.loading, t.loadingMirror);
            break;
    }

    LOG_TRACE(MOD_PROBE, "{} candidates for {}: {}", assetFamilyName(family), describe(ctx), out.size());
    return out;
}

} // namespace Assets
} // namespace CVW
