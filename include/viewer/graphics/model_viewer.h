#ifndef CVW_GRAPHICS_MODEL_VIEWER_H
#define CVW_GRAPHICS_MODEL_VIEWER_H

#include "common/net/http_client.h"
#include "viewer/assets/candidate_generator.h"
#include "viewer/assets/chroma_list.h"
#include "viewer/assets/directory_lister.h"
#include "viewer/assets/fallback_image_loader.h"
#include "viewer/assets/http_asset_prober.h"
#include "viewer/assets/http_image_source.h"
#include "viewer/assets/probe_resolver.h"
#include "viewer/assets/variant_orchestrator.h"
#include "viewer/graphics/emote_clip_selector.h"
#include "viewer/graphics/irrlicht_model_asset.h"
#include "viewer/graphics/model_normalizer.h"
#include "viewer/graphics/pan_offset.h"
#include "viewer/viewer_config.h"

#include <irrlicht.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CVW {
namespace Graphics {

struct ViewerOptions {
    int width = 1280;
    int height = 720;
    bool softwareRenderer = false;
    std::string windowTitle = "ChampView";
};

/**
 * ViewerEventReceiver - Collects key presses as one-shot requests and feeds
 * mouse drags into the splash pan controller.
 */
class ViewerEventReceiver : public irr::IEventReceiver {
public:
    explicit ViewerEventReceiver(PanDragController& pan) : pan_(pan) {}

    bool OnEvent(const irr::SEvent& event) override;

    // True once per press of key
    bool consumeKey(irr::EKEY_CODE key);

private:
    PanDragController& pan_;
    bool pressed_[irr::KEY_KEY_CODES_COUNT] = {};
};

/**
 * ModelViewer - Irrlicht window showing the current selection: splash art
 * behind, the normalized model with its companion and extra sub-models in
 * front.
 *
 * Models stand still on the first frame of their idle clip until animation
 * is switched on.
 *
 * Keys: Left/Right skin, PgUp/PgDn champion, C next chroma on offer, X clear
 * chroma, F alternate form, V next model version, I next idle clip, Space
 * animation on/off, E next emote, Q back to idle, G in-game relative size,
 * R re-center the splash, Esc quit. Drag with the left button to pan the
 * splash.
 */
class ModelViewer {
public:
    ModelViewer(const ViewerConfig& config, std::vector<Assets::SubjectRef> champions);
    ~ModelViewer();

    ModelViewer(const ModelViewer&) = delete;
    ModelViewer& operator=(const ModelViewer&) = delete;

    bool init(const ViewerOptions& options);
    void run();

    // Jump to a skin of the current champion
    void showSkin(uint32_t skinNumber) { selectSkin(skinNumber); }

private:
    // One model on screen and the download feeding it
    struct ModelSlot {
        std::string url;
        std::string textureUrl;
        irr::scene::ISceneNode* root = nullptr;
        std::unique_ptr<IrrlichtModelAsset> asset;
        HttpRequestId modelRequest = 0;
        HttpRequestId textureRequest = 0;
        NormalizedPose pose;
        std::vector<std::string> preferredIdles;
    };

    void selectChampion(size_t index);
    void selectSkin(uint32_t skinNumber);
    void onSnapshot(const Assets::RenderSnapshot& snapshot);

    void setSlotModel(ModelSlot& slot, const std::string& url, std::function<void(ModelSlot&)> onReady);
    void setSlotTexture(ModelSlot& slot, const std::optional<std::string>& url);
    void clearSlot(ModelSlot& slot);
    bool buildSlotNodes(ModelSlot& slot, const std::string& url, const std::string& bytes);
    void normalizeSlot(ModelSlot& slot, const std::vector<std::string>& preferredIdles,
                       const Assets::SizeOverride& placement);
    void applyPose(ModelSlot& slot);

    void normalizeMain(const std::vector<std::string>& preferredIdles, const Assets::SizeOverride& placement);

    void onSplashLoaded(const std::optional<std::string>& url);
    irr::video::ITexture* textureFromBytes(const std::string& url, const std::string& bytes);

    void handleInput();
    void cycleChroma();
    void cycleIdle();
    void setAnimating(bool animating);
    void toggleInGameScale();
    void playNextEmote();
    void updateEmote();
    void stopEmote();
    void forEachSlot(const std::function<void(ModelSlot&)>& fn);
    void updateCaption();
    void drawSplash();

    const ViewerConfig& config_;
    std::vector<Assets::SubjectRef> champions_;
    size_t championIndex_ = 0;
    uint32_t skinNumber_ = 0;
    size_t chromaIndex_ = 0;          // 1-based into snapshot_.chromas, 0 for none
    bool animating_ = false;
    bool inGameScale_ = false;

    HttpClient http_;
    Assets::AssetUrls urls_;
    Assets::CandidateGenerator generator_;
    Assets::HttpAssetProber prober_;
    Assets::HttpDirectoryLister lister_;
    Assets::ProbeResolver resolver_;
    Assets::HttpImageSource images_;
    Assets::HttpChromaListSource chromaLists_;
    Assets::VariantOrchestrator orchestrator_;
    Assets::FallbackImageLoader splashLoader_;
    ModelNormalizer normalizer_;
    PanDragController pan_;
    Assets::RenderSnapshot snapshot_;

    irr::IrrlichtDevice* device_ = nullptr;
    irr::video::IVideoDriver* driver_ = nullptr;
    irr::scene::ISceneManager* smgr_ = nullptr;
    std::unique_ptr<ViewerEventReceiver> receiver_;
    irr::video::ITexture* splashTexture_ = nullptr;

    ModelSlot main_;
    ModelSlot companion_;
    std::vector<std::unique_ptr<ModelSlot>> extras_;
    std::vector<std::string> idleClips_;
    size_t idleIndex_ = 0;

    std::vector<EmotePhase> emotePhases_;
    size_t emotePhase_ = 0;
    size_t emoteCount_ = 0;
};

} // namespace Graphics
} // namespace CVW

#endif // CVW_GRAPHICS_MODEL_VIEWER_H
