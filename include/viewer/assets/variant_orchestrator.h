#pragma once

#include "viewer/assets/cancellation.h"
#include "viewer/assets/candidate_generator.h"
#include "viewer/assets/chroma_list.h"
#include "viewer/assets/probe_resolver.h"
#include "viewer/assets/resolution_state_machine.h"
#include "viewer/assets/selection_context.h"

#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CVW {
namespace Assets {

struct ExtraModelPlacement {
    std::string url;
    glm::vec3 positionOffset{0.0f};
    float scaleMultiplier = 1.0f;
};

/**
 * RenderSnapshot - Everything the render surface needs to show the current
 * selection, merged from all resolution axes.
 */
struct RenderSnapshot {
    SubjectRef subject;
    uint32_t skinId = 0;
    std::optional<uint32_t> chromaId;

    std::string modelUrl;
    std::string modelAlias;       // alias the model URL was built from
    uint32_t modelSkinId = 0;     // skin id the model URL was built from
    std::optional<std::string> textureUrl;

    std::optional<std::string> companionModelUrl;
    std::optional<std::string> companionTextureUrl;
    std::vector<ExtraModelPlacement> extraModels;
    std::optional<glm::vec3> mainModelOffset;

    std::optional<std::string> idleOverride;  // alternate form, then active version
    std::optional<std::string> preferredIdle; // wins over the default when the model has it
    std::optional<std::string> defaultIdle;   // catalog default for the model

    std::vector<ChromaInfo> chromas;          // on offer for the current skin
    bool chromaListLoading = false;

    bool alternateFormActive = false;
    std::optional<std::string> alternateFormLabel;
    bool offersAlternateForm = false;

    std::vector<std::string> versionLabels;
    uint32_t versionIndex = 0;                // 0 is the current model
    std::string nextVersionLabel;
    bool offersVersions = false;

    bool chromaResolving = false;
    bool settled = true;
};

/**
 * VariantOrchestrator - Front door of the resolution engine.
 *
 * Owns one ResolutionStateMachine per axis: the chroma texture of the main
 * model and of the companion, the alternate form (model or texture), one per
 * configured historical version (model and texture), the companion model and
 * one per extra sub-model. Each selection change is turned into contexts for
 * those axes and the merged result is published as a RenderSnapshot.
 *
 * Changing character or skin resets every axis. Changing only the chroma
 * leaves the other axes alone. Resolved chroma URLs are remembered per
 * character until clearChromaCache().
 *
 * With a chroma list source, the chromas on offer are fetched once per
 * character and kept until clearChromaListCache(). Failed fetches are not
 * kept.
 */
class VariantOrchestrator {
public:
    using ChangeListener = std::function<void(const RenderSnapshot&)>;

    VariantOrchestrator(const CandidateGenerator& generator, ProbeResolver& resolver,
                        IChromaListSource* chromaLists = nullptr);
    ~VariantOrchestrator();

    VariantOrchestrator(const VariantOrchestrator&) = delete;
    VariantOrchestrator& operator=(const VariantOrchestrator&) = delete;

    void selectSkin(const SubjectRef& subject, uint32_t skinNumber);
    void selectChroma(std::optional<uint32_t> chromaId);

    void setAlternateForm(bool active);
    void toggleAlternateForm() { setAlternateForm(!m_formActive); }

    // Cycles current -> version 1 -> ... -> version N -> current over the
    // versions that resolved.
    void cycleVersion();
    void setVersionIndex(uint32_t index);

    RenderSnapshot snapshot() const;
    bool isSettled() const;

    void setChangeListener(ChangeListener listener) { m_listener = std::move(listener); }

    void clearChromaCache();
    size_t cachedChromaCount() const;

    // Drops every fetched chroma list and asks again for the current character
    void clearChromaListCache();
    size_t cachedChromaListCount() const { return m_chromaLists.size(); }

private:
    struct VersionAxis {
        size_t catalogIndex = 0;
        std::unique_ptr<ResolutionStateMachine> model;
        std::unique_ptr<ResolutionStateMachine> texture;
    };

    struct ResolvedVersion {
        const ModelVersion* def = nullptr;
        const VersionAxis* axis = nullptr;
        std::string modelUrl;
        uint32_t resolvedSkinId = 0;
    };

    std::unique_ptr<ResolutionStateMachine> makeMachine(AssetFamily family);
    SelectionContext baseContext() const;
    std::optional<std::string> companionAlias() const;

    void rebuildSubjectAxes();
    void submitChroma();
    void requestChromaList();
    void submitForm();
    void onAxisChanged();
    void onVersionModelChanged(VersionAxis& axis);
    void notify();
    void beginBatch() { ++m_batchDepth; }
    void endBatch();

    std::vector<ResolvedVersion> resolvedVersions() const;

    const CandidateGenerator& m_generator;
    ProbeResolver& m_resolver;

    SubjectRef m_subject;
    uint32_t m_skinId = 0;
    std::optional<uint32_t> m_chromaId;
    bool m_formActive = false;
    uint32_t m_versionIndex = 0;

    std::unique_ptr<ResolutionStateMachine> m_chroma;
    std::unique_ptr<ResolutionStateMachine> m_companionChroma;
    std::unique_ptr<ResolutionStateMachine> m_formModel;
    std::unique_ptr<ResolutionStateMachine> m_formTexture;
    std::unique_ptr<ResolutionStateMachine> m_companionModel;
    std::vector<std::unique_ptr<VersionAxis>> m_versions;
    std::vector<std::unique_ptr<ResolutionStateMachine>> m_extras;

    IChromaListSource* m_chromaListSource;
    std::map<std::string, SkinChromaMap> m_chromaLists;
    CancelSource m_chromaListFetch;
    bool m_chromaListPending = false;

    // subject id -> chroma id -> texture url
    std::map<std::string, std::map<uint32_t, std::string>> m_chromaCache;
    std::map<std::string, std::map<uint32_t, std::string>> m_companionChromaCache;

    ChangeListener m_listener;
    int m_batchDepth = 0;
    bool m_dirty = false;
};

} // namespace Assets
} // namespace CVW
