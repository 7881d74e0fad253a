#include "viewer/assets/variant_orchestrator.h"
#include "common/logging.h"

namespace CVW {
namespace Assets {

namespace {

bool isResolved(const ResolutionStateMachine& machine)
{
    return machine.current().status == ResolutionStatus::Resolved && machine.current().resolvedUrl;
}

bool isPending(const ResolutionStateMachine* machine)
{
    return machine && machine->current().status == ResolutionStatus::Pending;
}

// Submit ctx to a chroma axis, answering from the cache when possible.
void submitChromaAxis(ResolutionStateMachine& machine,
                      const std::map<std::string, std::map<uint32_t, std::string>>& cache,
                      const SelectionContext& ctx)
{
    if (const auto* chroma = std::get_if<ChromaVariant>(&ctx.variant)) {
        auto subject = cache.find(ctx.subject.id);
        if (subject != cache.end()) {
            auto hit = subject->second.find(chroma->chromaId);
            if (hit != subject->second.end()) {
                if (machine.context() && *machine.context() == ctx) {
                    return;
                }
                LOG_TRACE(MOD_VARIANT, "Chroma {} served from cache", chroma->chromaId);
                machine.settle(ctx, hit->second);
                return;
            }
        }
    }
    machine.submit(ctx);
}

void rememberChroma(const ResolutionStateMachine& machine,
                    std::map<std::string, std::map<uint32_t, std::string>>& cache)
{
    if (!isResolved(machine) || !machine.context()) {
        return;
    }
    const SelectionContext& ctx = *machine.context();
    if (const auto* chroma = std::get_if<ChromaVariant>(&ctx.variant)) {
        cache[ctx.subject.id][chroma->chromaId] = *machine.current().resolvedUrl;
    }
}

} // namespace

VariantOrchestrator::VariantOrchestrator(const CandidateGenerator& generator, ProbeResolver& resolver,
                                         IChromaListSource* chromaLists)
    : m_generator(generator), m_resolver(resolver), m_chromaListSource(chromaLists)
{
    m_chroma = makeMachine(AssetFamily::ChromaTexture);
    m_companionChroma = makeMachine(AssetFamily::CompanionChromaTexture);
    m_formModel = makeMachine(AssetFamily::AlternateFormModel);
    m_formTexture = makeMachine(AssetFamily::AlternateFormTexture);
    m_companionModel = makeMachine(AssetFamily::CompanionModel);
}

VariantOrchestrator::~VariantOrchestrator()
{
    m_chromaListFetch.cancel();
}

std::unique_ptr<ResolutionStateMachine> VariantOrchestrator::makeMachine(AssetFamily family)
{
    auto machine = std::make_unique<ResolutionStateMachine>(family, m_generator, m_resolver);
    machine->setListener([this](const ResolutionResult&) { onAxisChanged(); });
    return machine;
}

std::optional<std::string> VariantOrchestrator::companionAlias() const
{
    const auto& aliases = m_generator.catalog().companionAliases(m_subject.id);
    if (aliases.empty()) {
        return std::nullopt;
    }
    return aliases.front();
}

SelectionContext VariantOrchestrator::baseContext() const
{
    SelectionContext ctx;
    ctx.subject = m_subject;
    ctx.skinId = m_skinId;
    ctx.companionAlias = companionAlias();
    return ctx;
}

void VariantOrchestrator::rebuildSubjectAxes()
{
    const AssetCatalog& catalog = m_generator.catalog();

    m_versions.clear();
    const auto& versions = catalog.modelVersions(m_subject.id);
    for (size_t i = 0; i < versions.size(); ++i) {
        auto axis = std::make_unique<VersionAxis>();
        axis->catalogIndex = i;
        axis->model = std::make_unique<ResolutionStateMachine>(AssetFamily::HistoricalVersionModel,
                                                               m_generator, m_resolver);
        axis->texture = makeMachine(AssetFamily::HistoricalVersionTexture);
        VersionAxis* raw = axis.get();
        axis->model->setListener([this, raw](const ResolutionResult&) { onVersionModelChanged(*raw); });
        m_versions.push_back(std::move(axis));
    }

    m_extras.clear();
    for (size_t i = 0; i < catalog.extraModels(m_subject.id).size(); ++i) {
        m_extras.push_back(makeMachine(AssetFamily::ExtraModel));
    }

    LOG_DEBUG(MOD_VARIANT, "{}: {} version axes, {} extra model axes", m_subject.id,
              m_versions.size(), m_extras.size());
}

void VariantOrchestrator::selectSkin(const SubjectRef& subject, uint32_t skinNumber)
{
    beginBatch();

    const bool subjectChanged = subject != m_subject;
    m_subject = subject;
    m_skinId = makeSkinId(subject.key, skinNumber);
    m_chromaId.reset();
    m_formActive = false;
    m_versionIndex = 0;

    LOG_INFO(MOD_VARIANT, "Select {} skin {} ({})", subject.id, skinNumber, m_skinId);

    if (subjectChanged) {
        rebuildSubjectAxes();
        m_chromaListFetch.cancel();
        m_chromaListPending = false;
    }
    requestChromaList();

    submitChroma();
    submitForm();

    for (auto& axis : m_versions) {
        SelectionContext ctx = baseContext();
        ctx.variant = HistoricalVersionVariant{static_cast<uint32_t>(axis->catalogIndex)};
        axis->model->submit(ctx);
    }

    const auto& companions = m_generator.catalog().companionAliases(m_subject.id);
    if (companions.empty()) {
        m_companionModel->clear();
    } else {
        SelectionContext ctx = baseContext();
        ctx.variant = ExtraModelVariant{companions};
        m_companionModel->submit(ctx);
    }

    const auto& extras = m_generator.catalog().extraModels(m_subject.id);
    for (size_t i = 0; i < m_extras.size() && i < extras.size(); ++i) {
        SelectionContext ctx = baseContext();
        ctx.variant = ExtraModelVariant{extras[i].aliases};
        m_extras[i]->submit(ctx);
    }

    endBatch();
}

void VariantOrchestrator::selectChroma(std::optional<uint32_t> chromaId)
{
    if (m_subject.empty()) {
        LOG_DEBUG(MOD_VARIANT, "Chroma selected before any skin, ignored");
        return;
    }

    beginBatch();
    m_chromaId = chromaId;
    LOG_DEBUG(MOD_VARIANT, "Select chroma {}", chromaId ? std::to_string(*chromaId) : std::string("none"));
    submitChroma();
    endBatch();
}

void VariantOrchestrator::submitChroma()
{
    SelectionContext ctx = baseContext();
    if (m_chromaId) {
        ctx.variant = ChromaVariant{*m_chromaId};
    }

    submitChromaAxis(*m_chroma, m_chromaCache, ctx);
    if (ctx.companionAlias) {
        submitChromaAxis(*m_companionChroma, m_companionChromaCache, ctx);
    } else {
        m_companionChroma->clear();
    }
}

void VariantOrchestrator::requestChromaList()
{
    if (!m_chromaListSource || m_subject.empty() || m_chromaListPending ||
        m_chromaLists.count(m_subject.id) != 0) {
        return;
    }

    m_chromaListFetch = CancelSource();
    m_chromaListPending = true;
    CancelToken token = m_chromaListFetch.token();
    const SubjectRef subject = m_subject;
    LOG_DEBUG(MOD_VARIANT, "Fetching chroma list for {}", subject.id);

    m_chromaListSource->fetch(subject, [this, token, subject](std::optional<SkinChromaMap> chromas) {
        if (token.isCancelled()) {
            LOG_TRACE(MOD_VARIANT, "Dropping chroma list of {}", subject.id);
            return;
        }
        m_chromaListPending = false;
        if (chromas) {
            m_chromaLists[subject.id] = std::move(*chromas);
        } else {
            LOG_WARN(MOD_VARIANT, "No chroma list for {}", subject.id);
        }
        onAxisChanged();
    });
}

void VariantOrchestrator::submitForm()
{
    const AlternateForm* form = m_generator.catalog().alternateForm(m_subject.id);
    const bool modelKind = form && form->kind == AlternateForm::Kind::Model;

    SelectionContext modelCtx = baseContext();
    modelCtx.variant = AlternateFormVariant{m_formActive && modelKind};
    m_formModel->submit(modelCtx);

    SelectionContext textureCtx = baseContext();
    textureCtx.variant = AlternateFormVariant{m_formActive && form && !modelKind};
    m_formTexture->submit(textureCtx);
}

void VariantOrchestrator::setAlternateForm(bool active)
{
    if (active == m_formActive) {
        return;
    }
    if (active) {
        const RenderSnapshot s = snapshot();
        if (!s.offersAlternateForm) {
            LOG_DEBUG(MOD_VARIANT, "{} has no alternate form on offer", m_subject.id);
            return;
        }
    }

    beginBatch();
    m_formActive = active;
    LOG_DEBUG(MOD_VARIANT, "Alternate form {}", active ? "on" : "off");
    submitForm();
    m_dirty = true;
    endBatch();
}

void VariantOrchestrator::cycleVersion()
{
    const size_t count = resolvedVersions().size();
    if (count == 0) {
        return;
    }
    m_versionIndex = static_cast<uint32_t>((m_versionIndex + 1) % (count + 1));
    LOG_DEBUG(MOD_VARIANT, "Version index {}", m_versionIndex);
    notify();
}

void VariantOrchestrator::setVersionIndex(uint32_t index)
{
    const size_t count = resolvedVersions().size();
    m_versionIndex = index > count ? 0 : index;
    notify();
}

void VariantOrchestrator::onVersionModelChanged(VersionAxis& axis)
{
    const auto& defs = m_generator.catalog().modelVersions(m_subject.id);
    const bool wantsTexture = axis.catalogIndex < defs.size() && defs[axis.catalogIndex].hasTexture;

    beginBatch();
    if (isResolved(*axis.model) && axis.model->context() && wantsTexture) {
        // The texture lives beside whichever skin's model was found.
        SelectionContext ctx = *axis.model->context();
        CandidateList candidates = m_generator.generate(ctx, AssetFamily::HistoricalVersionModel);
        if (candidates.empty() || candidates[0].url != *axis.model->current().resolvedUrl) {
            ctx.skinId = ctx.baseSkinId();
        }
        axis.texture->submit(ctx);
    } else if (axis.texture->current().status != ResolutionStatus::Idle) {
        axis.texture->clear();
    }
    onAxisChanged();
    endBatch();
}

void VariantOrchestrator::onAxisChanged()
{
    rememberChroma(*m_chroma, m_chromaCache);
    rememberChroma(*m_companionChroma, m_companionChromaCache);

    const size_t count = resolvedVersions().size();
    if (m_versionIndex > count) {
        LOG_DEBUG(MOD_VARIANT, "Version index {} out of range ({}), back to current", m_versionIndex, count);
        m_versionIndex = 0;
    }

    if (m_batchDepth > 0) {
        m_dirty = true;
        return;
    }
    notify();
}

void VariantOrchestrator::endBatch()
{
    if (--m_batchDepth == 0 && m_dirty) {
        m_dirty = false;
        notify();
    }
}

void VariantOrchestrator::notify()
{
    if (m_batchDepth > 0) {
        m_dirty = true;
        return;
    }
    if (m_listener) {
        m_listener(snapshot());
    }
}

std::vector<VariantOrchestrator::ResolvedVersion> VariantOrchestrator::resolvedVersions() const
{
    std::vector<ResolvedVersion> out;
    const auto& defs = m_generator.catalog().modelVersions(m_subject.id);

    for (const auto& axis : m_versions) {
        if (axis->catalogIndex >= defs.size() || !isResolved(*axis->model) || !axis->model->context()) {
            continue;
        }
        ResolvedVersion v;
        v.def = &defs[axis->catalogIndex];
        v.axis = axis.get();
        v.modelUrl = *axis->model->current().resolvedUrl;

        const SelectionContext& ctx = *axis->model->context();
        CandidateList candidates = m_generator.generate(ctx, AssetFamily::HistoricalVersionModel);
        v.resolvedSkinId = !candidates.empty() && candidates[0].url == v.modelUrl
            ? ctx.skinId : ctx.baseSkinId();
        out.push_back(v);
    }
    return out;
}

bool VariantOrchestrator::isSettled() const
{
    if (m_chromaListPending) {
        return false;
    }
    if (isPending(m_chroma.get()) || isPending(m_companionChroma.get()) ||
        isPending(m_formModel.get()) || isPending(m_formTexture.get()) ||
        isPending(m_companionModel.get())) {
        return false;
    }
    for (const auto& axis : m_versions) {
        if (isPending(axis->model.get()) || isPending(axis->texture.get())) {
            return false;
        }
    }
    for (const auto& extra : m_extras) {
        if (isPending(extra.get())) {
            return false;
        }
    }
    return true;
}

RenderSnapshot VariantOrchestrator::snapshot() const
{
    RenderSnapshot s;
    s.subject = m_subject;
    s.skinId = m_skinId;
    s.chromaId = m_chromaId;
    if (m_subject.empty()) {
        return s;
    }

    const AssetCatalog& catalog = m_generator.catalog();
    const AlternateForm* form = catalog.alternateForm(m_subject.id);
    const std::vector<ResolvedVersion> versions = resolvedVersions();
    const ResolvedVersion* active = nullptr;
    if (!m_formActive && m_versionIndex > 0 && m_versionIndex <= versions.size()) {
        active = &versions[m_versionIndex - 1];
    }

    // Model: alternate form > active version > default
    s.modelAlias = m_subject.alias();
    s.modelSkinId = m_skinId;
    s.modelUrl = m_generator.modelUrl(s.modelAlias, m_skinId);
    if (active) {
        s.modelUrl = active->modelUrl;
        s.modelSkinId = active->resolvedSkinId;
    }
    if (m_formActive && form && form->kind == AlternateForm::Kind::Model && isResolved(*m_formModel)) {
        s.modelUrl = *m_formModel->current().resolvedUrl;
        s.modelAlias = form->alias;
        s.modelSkinId = s.modelUrl == m_generator.modelUrl(form->alias, m_skinId)
            ? m_skinId : baseSkinIdOf(m_skinId);
    }

    // Texture: alternate form > active version > chroma
    if (m_formActive && isResolved(*m_formTexture)) {
        s.textureUrl = m_formTexture->current().resolvedUrl;
    } else if (active && isResolved(*active->axis->texture)) {
        s.textureUrl = active->axis->texture->current().resolvedUrl;
    } else if (m_chromaId && isResolved(*m_chroma)) {
        s.textureUrl = m_chroma->current().resolvedUrl;
    }

    if (isResolved(*m_companionModel)) {
        s.companionModelUrl = m_companionModel->current().resolvedUrl;
    }
    if (m_chromaId && isResolved(*m_companionChroma)) {
        s.companionTextureUrl = m_companionChroma->current().resolvedUrl;
    }

    const auto& extras = catalog.extraModels(m_subject.id);
    for (size_t i = 0; i < m_extras.size() && i < extras.size(); ++i) {
        if (isResolved(*m_extras[i])) {
            s.extraModels.push_back({*m_extras[i]->current().resolvedUrl, extras[i].positionOffset,
                                     extras[i].scaleMultiplier});
        }
    }
    s.mainModelOffset = catalog.mainModelOffset(m_subject.id);

    if (m_formActive && form && !form->idleAnimation.empty()) {
        s.idleOverride = form->idleAnimation;
    } else if (active && !active->def->idleAnimation.empty()) {
        s.idleOverride = active->def->idleAnimation;
    }
    s.preferredIdle = catalog.preferredIdleAnimation(s.modelAlias);
    s.defaultIdle = catalog.defaultIdleAnimation(s.modelAlias, s.modelSkinId);

    auto list = m_chromaLists.find(m_subject.id);
    if (list != m_chromaLists.end()) {
        auto skin = list->second.find(m_skinId);
        if (skin != list->second.end()) {
            s.chromas = skin->second;
        }
    }
    s.chromaListLoading = m_chromaListPending;

    const bool companionShown = s.companionModelUrl.has_value();
    s.alternateFormActive = m_formActive;
    if (form) {
        s.alternateFormLabel = form->label;
    }
    s.offersAlternateForm = form != nullptr && !companionShown;

    for (const auto& v : versions) {
        s.versionLabels.push_back(v.def->label);
    }
    s.versionIndex = m_versionIndex;
    if (versions.empty()) {
        s.nextVersionLabel = "alternate";
    } else {
        const size_t next = (m_versionIndex + 1) % (versions.size() + 1);
        s.nextVersionLabel = next == 0 ? "current" : versions[next - 1].def->label;
    }
    s.offersVersions = !versions.empty() && !companionShown;

    s.chromaResolving = isPending(m_chroma.get()) || isPending(m_companionChroma.get());
    s.settled = isSettled();
    return s;
}

void VariantOrchestrator::clearChromaCache()
{
    LOG_DEBUG(MOD_VARIANT, "Clearing {} cached chroma textures", cachedChromaCount());
    m_chromaCache.clear();
    m_companionChromaCache.clear();
}

void VariantOrchestrator::clearChromaListCache()
{
    LOG_DEBUG(MOD_VARIANT, "Clearing {} cached chroma lists", m_chromaLists.size());
    beginBatch();
    m_chromaListFetch.cancel();
    m_chromaListPending = false;
    m_chromaLists.clear();
    requestChromaList();
    m_dirty = true;
    endBatch();
}

size_t VariantOrchestrator::cachedChromaCount() const
{
    size_t count = 0;
    for (const auto& kv : m_chromaCache) {
        count += kv.second.size();
    }
    for (const auto& kv : m_companionChromaCache) {
        count += kv.second.size();
    }
    return count;
}

} // namespace Assets
} // namespace CVW
