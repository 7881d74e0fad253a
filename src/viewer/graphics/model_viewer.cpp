#include "viewer/graphics/model_viewer.h"
#include "viewer/graphics/idle_clip_selector.h"
#include "common/event/event_loop.h"
#include "common/logging.h"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace CVW {
namespace Graphics {

namespace {

// Companion models stand beside the champion
const glm::vec3 kCompanionOffset(1.4f, 0.0f, 0.4f);

const irr::video::SColor kClearColor(255, 20, 22, 30);

void setTextureRecursive(irr::scene::ISceneNode* node, irr::video::ITexture* texture) {
    node->setMaterialTexture(0, texture);
    const auto& children = node->getChildren();
    for (auto it = children.begin(); it != children.end(); ++it) {
        setTextureRecursive(*it, texture);
    }
}

} // namespace

bool ViewerEventReceiver::OnEvent(const irr::SEvent& event) {
    if (event.EventType == irr::EET_KEY_INPUT_EVENT) {
        if (event.KeyInput.PressedDown && event.KeyInput.Key < irr::KEY_KEY_CODES_COUNT) {
            pressed_[event.KeyInput.Key] = true;
        }
        return false;
    }

    if (event.EventType == irr::EET_MOUSE_INPUT_EVENT) {
        const float x = static_cast<float>(event.MouseInput.X);
        const float y = static_cast<float>(event.MouseInput.Y);
        switch (event.MouseInput.Event) {
            case irr::EMIE_LMOUSE_PRESSED_DOWN:
                pan_.pointerDown(x, y);
                break;
            case irr::EMIE_MOUSE_MOVED:
                pan_.pointerMove(x, y);
                break;
            case irr::EMIE_LMOUSE_LEFT_UP:
                pan_.pointerUp();
                break;
            default:
                break;
        }
    }
    return false;
}

bool ViewerEventReceiver::consumeKey(irr::EKEY_CODE key) {
    if (!pressed_[key]) {
        return false;
    }
    pressed_[key] = false;
    return true;
}

ModelViewer::ModelViewer(const ViewerConfig& config, std::vector<Assets::SubjectRef> champions)
    : config_(config)
    , champions_(std::move(champions))
    , urls_(config.hosts(), config.urlTemplates())
    , generator_(config.catalog(), urls_)
    , prober_(http_, config.probe().cacheResults)
    , lister_(http_)
    , resolver_(prober_, &lister_)
    , images_(http_)
    , chromaLists_(http_, urls_)
    , orchestrator_(generator_, resolver_, &chromaLists_)
    , splashLoader_(images_, config.art().loadTimeoutMs)
    , normalizer_(config.normalizer()) {
    http_.SetTimeoutMs(config.probe().timeoutMs);
}

ModelViewer::~ModelViewer() {
    orchestrator_.setChangeListener(nullptr);
    splashLoader_.setListener(nullptr);
    clearSlot(main_);
    clearSlot(companion_);
    for (auto& extra : extras_) {
        clearSlot(*extra);
    }
    extras_.clear();

    if (device_) {
        device_->drop();
        device_ = nullptr;
    }
    LOG_INFO(MOD_GRAPHICS, "ModelViewer shutdown");
}

bool ModelViewer::init(const ViewerOptions& options) {
    if (champions_.empty()) {
        LOG_ERROR(MOD_GRAPHICS, "No champions to show");
        return false;
    }
    if (!http_.IsReady()) {
        LOG_ERROR(MOD_GRAPHICS, "HTTP client unavailable");
        return false;
    }

    irr::SIrrlichtCreationParameters params;
    params.DriverType = options.softwareRenderer ? irr::video::EDT_BURNINGSVIDEO : irr::video::EDT_OPENGL;
    params.WindowSize = irr::core::dimension2d<irr::u32>(options.width, options.height);
    params.Stencilbuffer = false;
    params.Vsync = true;
    params.AntiAlias = 0;

    device_ = irr::createDeviceEx(params);

    if (!device_) {
        // Fall back to basic software renderer
        params.DriverType = irr::video::EDT_SOFTWARE;
        device_ = irr::createDeviceEx(params);
    }

    if (!device_) {
        LOG_ERROR(MOD_GRAPHICS, "Failed to create Irrlicht device");
        return false;
    }

    device_->getLogger()->setLogLevel(irr::ELL_ERROR);
    device_->setWindowCaption(irr::core::stringw(options.windowTitle.c_str()).c_str());

    driver_ = device_->getVideoDriver();
    smgr_ = device_->getSceneManager();

    receiver_ = std::make_unique<ViewerEventReceiver>(pan_);
    device_->setEventReceiver(receiver_.get());

    // Models are normalized to stand between baselineY and baselineY + targetHeight
    const NormalizerSettings& ns = normalizer_.settings();
    const float midY = ns.baselineY + ns.targetHeight * 0.5f;
    smgr_->addCameraSceneNode(nullptr,
                              irr::core::vector3df(0.0f, midY + 0.6f, -7.5f),
                              irr::core::vector3df(0.0f, midY, 0.0f));
    smgr_->setAmbientLight(irr::video::SColorf(0.6f, 0.6f, 0.6f));
    smgr_->addLightSceneNode(nullptr, irr::core::vector3df(3.0f, 6.0f, -6.0f),
                             irr::video::SColorf(1.0f, 1.0f, 1.0f), 20.0f);

    orchestrator_.setChangeListener([this](const Assets::RenderSnapshot& snapshot) {
        onSnapshot(snapshot);
    });
    splashLoader_.setListener([this](const std::optional<std::string>& url) {
        onSplashLoaded(url);
    });

    LOG_INFO(MOD_GRAPHICS, "ModelViewer initialized: {}x{}", options.width, options.height);

    selectChampion(0);
    return true;
}

void ModelViewer::run() {
    if (!device_) {
        return;
    }

    irr::u32 lastTime = device_->getTimer()->getTime();
    while (device_->run()) {
        EventLoop::Get().Process();
        handleInput();
        updateEmote();

        const irr::u32 now = device_->getTimer()->getTime();
        if (now - lastTime >= 1000) {
            updateCaption();
            lastTime = now;
        }

        driver_->beginScene(true, true, kClearColor);
        drawSplash();
        smgr_->drawAll();
        driver_->endScene();
    }
}

void ModelViewer::selectChampion(size_t index) {
    championIndex_ = index % champions_.size();
    LOG_INFO(MOD_GRAPHICS, "Champion {} ({})", champions_[championIndex_].id, champions_[championIndex_].key);
    selectSkin(0);
}

void ModelViewer::selectSkin(uint32_t skinNumber) {
    skinNumber_ = skinNumber;
    chromaIndex_ = 0;
    const Assets::SubjectRef& subject = champions_[championIndex_];

    Assets::SelectionContext ctx;
    ctx.subject = subject;
    ctx.skinId = Assets::makeSkinId(subject.key, skinNumber);

    pan_.reset();
    if (splashTexture_) {
        driver_->removeTexture(splashTexture_);
        splashTexture_ = nullptr;
    }
    splashLoader_.setUrls(generator_.generate(ctx, Assets::AssetFamily::SplashArt).urls());

    orchestrator_.selectSkin(subject, skinNumber);
    // Same subject and skin does not notify; render what is there
    onSnapshot(orchestrator_.snapshot());
}

void ModelViewer::onSnapshot(const Assets::RenderSnapshot& snapshot) {
    snapshot_ = snapshot;

    Assets::SizeOverride mainPlacement = config_.catalog().sizeOverride(snapshot.modelAlias, snapshot.modelSkinId);
    if (snapshot.mainModelOffset) {
        mainPlacement.xShift += snapshot.mainModelOffset->x;
        mainPlacement.yShift += snapshot.mainModelOffset->y;
        mainPlacement.zShift += snapshot.mainModelOffset->z;
    }
    std::vector<std::string> idle;
    for (const auto* clip : {&snapshot.idleOverride, &snapshot.preferredIdle, &snapshot.defaultIdle}) {
        if (*clip) {
            idle.push_back(**clip);
        }
    }

    const std::optional<std::string> mainTexture = snapshot.textureUrl;
    setSlotModel(main_, snapshot.modelUrl, [this, idle, mainPlacement, mainTexture](ModelSlot& slot) {
        normalizeMain(idle, mainPlacement);
        slot.textureUrl.clear();
        setSlotTexture(slot, mainTexture);
    });
    if (main_.asset) {
        // Same model, different idle (texture-only alternate forms)
        if (main_.preferredIdles != idle) {
            normalizeMain(idle, mainPlacement);
        }
        setSlotTexture(main_, snapshot.textureUrl);
    }

    if (snapshot.companionModelUrl) {
        Assets::SizeOverride placement;
        placement.xShift = kCompanionOffset.x;
        placement.yShift = kCompanionOffset.y;
        placement.zShift = kCompanionOffset.z;
        const std::optional<std::string> texture = snapshot.companionTextureUrl;
        setSlotModel(companion_, *snapshot.companionModelUrl, [this, placement, texture](ModelSlot& slot) {
            normalizeSlot(slot, {}, placement);
            slot.textureUrl.clear();
            setSlotTexture(slot, texture);
        });
        if (companion_.asset) {
            setSlotTexture(companion_, snapshot.companionTextureUrl);
        }
    } else {
        clearSlot(companion_);
    }

    // Extra sub-models are rebuilt only when their URLs change
    bool extrasChanged = extras_.size() != snapshot.extraModels.size();
    for (size_t i = 0; !extrasChanged && i < extras_.size(); ++i) {
        extrasChanged = extras_[i]->url != snapshot.extraModels[i].url;
    }
    if (extrasChanged) {
        for (auto& extra : extras_) {
            clearSlot(*extra);
        }
        extras_.clear();
        for (const auto& placement : snapshot.extraModels) {
            Assets::SizeOverride so;
            so.scale = placement.scaleMultiplier;
            so.xShift = placement.positionOffset.x;
            so.yShift = placement.positionOffset.y;
            so.zShift = placement.positionOffset.z;
            extras_.push_back(std::make_unique<ModelSlot>());
            setSlotModel(*extras_.back(), placement.url, [this, so](ModelSlot& slot) {
                normalizeSlot(slot, {}, so);
            });
        }
    }

    updateCaption();
}

void ModelViewer::setSlotModel(ModelSlot& slot, const std::string& url, std::function<void(ModelSlot&)> onReady) {
    if (url.empty()) {
        clearSlot(slot);
        return;
    }
    if (slot.url == url) {
        return;
    }

    clearSlot(slot);
    slot.url = url;

    ModelSlot* target = &slot;
    LOG_DEBUG(MOD_MODEL, "Downloading model {}", url);
    const HttpRequestId id = http_.Get(url, [this, target, url, onReady](const HttpResponse& response) {
        target->modelRequest = 0;
        if (!response.Ok()) {
            LOG_WARN(MOD_MODEL, "Model download failed for {}: {}", url,
                     response.TransportFailed() ? response.error : fmt::format("HTTP {}", response.status));
        }
        if (!buildSlotNodes(*target, url, response.Ok() ? response.body : std::string())) {
            return;
        }
        onReady(*target);
    });
    slot.modelRequest = id;
}

bool ModelViewer::buildSlotNodes(ModelSlot& slot, const std::string& url, const std::string& bytes) {
    if (!smgr_) {
        return false;
    }

    slot.root = smgr_->addEmptySceneNode();
    irr::scene::IAnimatedMeshSceneNode* animated = nullptr;

    if (!bytes.empty()) {
        irr::io::IReadFile* file = device_->getFileSystem()->createMemoryReadFile(
            bytes.data(), static_cast<irr::s32>(bytes.size()), irr::io::path(url.c_str()), false);
        irr::scene::IAnimatedMesh* mesh = file ? smgr_->getMesh(file) : nullptr;
        if (file) {
            file->drop();
        }
        if (mesh) {
            animated = smgr_->addAnimatedMeshSceneNode(mesh, slot.root);
        } else {
            LOG_WARN(MOD_MODEL, "No mesh loader accepted {}; showing placeholder", url);
        }
    }

    if (!animated) {
        irr::scene::IMeshSceneNode* cube = smgr_->addCubeSceneNode(1.0f, slot.root);
        cube->setScale(irr::core::vector3df(0.6f, 1.8f, 0.6f));
        cube->setPosition(irr::core::vector3df(0.0f, 0.9f, 0.0f));
    }

    const auto& children = slot.root->getChildren();
    for (auto it = children.begin(); it != children.end(); ++it) {
        (*it)->setMaterialFlag(irr::video::EMF_LIGHTING, true);
    }

    slot.asset = std::make_unique<IrrlichtModelAsset>(slot.root, animated, IrrlichtModelAsset::defaultClips(animated));
    return true;
}

void ModelViewer::normalizeSlot(ModelSlot& slot, const std::vector<std::string>& preferredIdles,
                                const Assets::SizeOverride& placement) {
    slot.preferredIdles = preferredIdles;
    slot.pose = normalizer_.normalize(*slot.asset, preferredIdles, placement);
    applyPose(slot);
    if (animating_) {
        slot.asset->resume();
    }
    LOG_DEBUG(MOD_MODEL, "{}: scale {:.3f} from {} height {:.3f}, idle '{}'", slot.url, slot.pose.scale,
              heightSourceName(slot.pose.heightSource), slot.pose.measuredHeight,
              slot.pose.idleClipName.value_or(""));
}

// Normalized transform, optionally scaled about the baseline by the in-game
// relative size
void ModelViewer::applyPose(ModelSlot& slot) {
    if (!slot.asset) {
        return;
    }
    const float factor = inGameScale_ ? slot.pose.inGameScale : 1.0f;
    const float baselineY = normalizer_.settings().baselineY;
    const glm::vec3 position(slot.pose.centerOffsetX * factor,
                             baselineY + (slot.pose.groundOffsetY - baselineY) * factor,
                             slot.pose.centerOffsetZ * factor);
    slot.asset->setRootTransform(slot.pose.scale * factor, position);
    slot.asset->updateTransforms();
}

void ModelViewer::normalizeMain(const std::vector<std::string>& preferredIdles,
                                const Assets::SizeOverride& placement) {
    emotePhases_.clear();
    normalizeSlot(main_, preferredIdles, placement);
    idleClips_ = IdleClipSelector::findAllIdleNames(main_.asset->getClipNames());
    idleIndex_ = 0;
    if (main_.pose.idleClipName) {
        auto it = std::find(idleClips_.begin(), idleClips_.end(), *main_.pose.idleClipName);
        if (it != idleClips_.end()) {
            idleIndex_ = static_cast<size_t>(it - idleClips_.begin());
        }
    }
}

void ModelViewer::setSlotTexture(ModelSlot& slot, const std::optional<std::string>& url) {
    const std::string wanted = url.value_or("");
    if (!slot.root || slot.textureUrl == wanted) {
        return;
    }
    http_.Cancel(slot.textureRequest);
    slot.textureRequest = 0;
    slot.textureUrl = wanted;

    if (wanted.empty()) {
        setTextureRecursive(slot.root, nullptr);
        return;
    }

    ModelSlot* target = &slot;
    const HttpRequestId id = http_.Get(wanted, [this, target, wanted](const HttpResponse& response) {
        target->textureRequest = 0;
        if (!response.Ok() || !target->root) {
            LOG_WARN(MOD_MODEL, "Texture download failed for {}", wanted);
            return;
        }
        irr::video::ITexture* texture = textureFromBytes(wanted, response.body);
        if (texture) {
            setTextureRecursive(target->root, texture);
        }
    });
    slot.textureRequest = id;
}

void ModelViewer::clearSlot(ModelSlot& slot) {
    http_.Cancel(slot.modelRequest);
    http_.Cancel(slot.textureRequest);
    slot.modelRequest = 0;
    slot.textureRequest = 0;
    slot.asset.reset();
    if (slot.root) {
        slot.root->remove();
        slot.root = nullptr;
    }
    slot.url.clear();
    slot.textureUrl.clear();
    slot.pose = NormalizedPose{};
    slot.preferredIdles.clear();
}

irr::video::ITexture* ModelViewer::textureFromBytes(const std::string& url, const std::string& bytes) {
    irr::io::IReadFile* file = device_->getFileSystem()->createMemoryReadFile(
        bytes.data(), static_cast<irr::s32>(bytes.size()), irr::io::path(url.c_str()), false);
    if (!file) {
        return nullptr;
    }
    irr::video::ITexture* texture = driver_->getTexture(file);
    file->drop();
    if (!texture) {
        LOG_WARN(MOD_GRAPHICS, "No image loader accepted {}", url);
    }
    return texture;
}

void ModelViewer::onSplashLoaded(const std::optional<std::string>& url) {
    if (!url) {
        LOG_INFO(MOD_ART, "No splash art for {} skin {}", champions_[championIndex_].id, skinNumber_);
        return;
    }
    const std::string* bytes = images_.bytes(*url);
    if (!bytes) {
        return;
    }
    splashTexture_ = textureFromBytes(*url, *bytes);
    images_.forget(*url);
    if (!splashTexture_) {
        return;
    }

    const irr::core::dimension2d<irr::u32> screen = driver_->getScreenSize();
    const irr::core::dimension2d<irr::u32> image = splashTexture_->getOriginalSize();
    pan_.setGeometry(static_cast<float>(screen.Width), static_cast<float>(screen.Height),
                     static_cast<float>(image.Width), static_cast<float>(image.Height));
    LOG_DEBUG(MOD_ART, "Splash {} ({}x{}), pan limits {:.1f} x {:.1f}", *url, image.Width, image.Height,
              pan_.limits().maxX, pan_.limits().maxY);
}

void ModelViewer::drawSplash() {
    if (!splashTexture_) {
        return;
    }

    const irr::core::dimension2d<irr::u32> screen = driver_->getScreenSize();
    const irr::core::dimension2d<irr::u32> image = splashTexture_->getOriginalSize();
    if (image.Width == 0 || image.Height == 0) {
        return;
    }

    // Cover the panel, centered, then shifted by the pan offset
    const float scale = std::max(static_cast<float>(screen.Width) / image.Width,
                                 static_cast<float>(screen.Height) / image.Height);
    const irr::s32 w = static_cast<irr::s32>(std::round(image.Width * scale));
    const irr::s32 h = static_cast<irr::s32>(std::round(image.Height * scale));
    const irr::s32 x = (static_cast<irr::s32>(screen.Width) - w) / 2 + static_cast<irr::s32>(pan_.offset().x);
    const irr::s32 y = (static_cast<irr::s32>(screen.Height) - h) / 2 + static_cast<irr::s32>(pan_.offset().y);

    driver_->draw2DImage(splashTexture_,
                         irr::core::rect<irr::s32>(x, y, x + w, y + h),
                         irr::core::rect<irr::s32>(0, 0, image.Width, image.Height));
}

void ModelViewer::handleInput() {
    if (receiver_->consumeKey(irr::KEY_ESCAPE)) {
        device_->closeDevice();
        return;
    }
    if (receiver_->consumeKey(irr::KEY_RIGHT)) {
        selectSkin(skinNumber_ + 1);
    }
    if (receiver_->consumeKey(irr::KEY_LEFT) && skinNumber_ > 0) {
        selectSkin(skinNumber_ - 1);
    }
    if (receiver_->consumeKey(irr::KEY_NEXT)) {
        selectChampion(championIndex_ + 1);
    }
    if (receiver_->consumeKey(irr::KEY_PRIOR)) {
        selectChampion(championIndex_ + champions_.size() - 1);
    }
    if (receiver_->consumeKey(irr::KEY_KEY_C)) {
        cycleChroma();
    }
    if (receiver_->consumeKey(irr::KEY_KEY_X)) {
        chromaIndex_ = 0;
        orchestrator_.selectChroma(std::nullopt);
    }
    if (receiver_->consumeKey(irr::KEY_KEY_F)) {
        orchestrator_.toggleAlternateForm();
    }
    if (receiver_->consumeKey(irr::KEY_KEY_V)) {
        orchestrator_.cycleVersion();
    }
    if (receiver_->consumeKey(irr::KEY_KEY_I)) {
        cycleIdle();
    }
    if (receiver_->consumeKey(irr::KEY_SPACE)) {
        setAnimating(!animating_);
    }
    if (receiver_->consumeKey(irr::KEY_KEY_E)) {
        playNextEmote();
    }
    if (receiver_->consumeKey(irr::KEY_KEY_Q)) {
        stopEmote();
    }
    if (receiver_->consumeKey(irr::KEY_KEY_G)) {
        toggleInGameScale();
    }
    if (receiver_->consumeKey(irr::KEY_KEY_R)) {
        pan_.reset();
    }
}

void ModelViewer::forEachSlot(const std::function<void(ModelSlot&)>& fn) {
    fn(main_);
    fn(companion_);
    for (auto& extra : extras_) {
        fn(*extra);
    }
}

void ModelViewer::cycleChroma() {
    const std::vector<Assets::ChromaInfo>& chromas = snapshot_.chromas;
    if (chromas.empty()) {
        LOG_INFO(MOD_INPUT, "No chromas on offer for skin {}{}", snapshot_.skinId,
                 snapshot_.chromaListLoading ? " (list loading)" : "");
        return;
    }
    chromaIndex_ = chromaIndex_ % chromas.size() + 1;
    const Assets::ChromaInfo& chroma = chromas[chromaIndex_ - 1];
    LOG_DEBUG(MOD_INPUT, "Chroma {} '{}'", chroma.id, chroma.name);
    orchestrator_.selectChroma(chroma.id);
}

void ModelViewer::cycleIdle() {
    if (!main_.asset || idleClips_.size() < 2) {
        return;
    }
    emotePhases_.clear();
    idleIndex_ = (idleIndex_ + 1) % idleClips_.size();
    if (main_.asset->playClip(idleClips_[idleIndex_])) {
        if (animating_) {
            main_.asset->resume();
        } else {
            main_.asset->advance(normalizer_.settings().primeTickSeconds);
            main_.asset->pause();
        }
        LOG_DEBUG(MOD_MODEL, "Idle clip {}", idleClips_[idleIndex_]);
    }
}

void ModelViewer::setAnimating(bool animating) {
    animating_ = animating;
    LOG_DEBUG(MOD_INPUT, "Animation {}", animating ? "on" : "off");
    forEachSlot([animating](ModelSlot& slot) {
        if (!slot.asset) {
            return;
        }
        if (animating) {
            slot.asset->resume();
        } else {
            slot.asset->pause();
        }
    });
}

void ModelViewer::toggleInGameScale() {
    inGameScale_ = !inGameScale_;
    LOG_DEBUG(MOD_INPUT, "In-game size {} (main x{:.2f})", inGameScale_ ? "on" : "off", main_.pose.inGameScale);
    forEachSlot([this](ModelSlot& slot) { applyPose(slot); });
}

// Emote types in turn; each full round moves to the next take of each type
void ModelViewer::playNextEmote() {
    if (!main_.asset) {
        return;
    }
    const auto emotes = EmoteClipSelector::availableEmotes(main_.asset->getClipNames());
    if (emotes.empty()) {
        LOG_INFO(MOD_INPUT, "{} has no emotes", main_.url);
        return;
    }

    const auto& emote = emotes[emoteCount_ % emotes.size()];
    const EmoteVariant& variant = emote.second[(emoteCount_ / emotes.size()) % emote.second.size()];
    ++emoteCount_;

    emotePhases_ = EmoteClipSelector::phases(variant);
    emotePhase_ = 0;
    LOG_DEBUG(MOD_MODEL, "Emote {} '{}' ({} phases)", emoteTypeName(emote.first), variant.main,
              emotePhases_.size());
    const EmotePhase& first = emotePhases_.front();
    if (!main_.asset->playClip(first.clip, first.loop)) {
        emotePhases_.clear();
        return;
    }
    main_.asset->resume();
}

void ModelViewer::updateEmote() {
    if (emotePhases_.empty() || !main_.asset || !main_.asset->clipFinished()) {
        return;
    }
    if (++emotePhase_ >= emotePhases_.size()) {
        stopEmote();
        return;
    }
    const EmotePhase& next = emotePhases_[emotePhase_];
    if (!main_.asset->playClip(next.clip, next.loop)) {
        stopEmote();
        return;
    }
    main_.asset->resume();
}

void ModelViewer::stopEmote() {
    if (emotePhases_.empty() || !main_.asset) {
        return;
    }
    emotePhases_.clear();
    const std::string idle = idleIndex_ < idleClips_.size() ? idleClips_[idleIndex_]
                                                             : main_.pose.idleClipName.value_or("");
    if (idle.empty() || !main_.asset->playClip(idle)) {
        main_.asset->pause();
        return;
    }
    if (animating_) {
        main_.asset->resume();
    } else {
        main_.asset->advance(normalizer_.settings().primeTickSeconds);
        main_.asset->pause();
    }
}

void ModelViewer::updateCaption() {
    if (!device_) {
        return;
    }

    std::string caption = fmt::format("ChampView - {} skin {}", champions_[championIndex_].id, skinNumber_);
    if (snapshot_.chromaId) {
        caption += fmt::format(" chroma {}", *snapshot_.chromaId);
        if (chromaIndex_ > 0 && chromaIndex_ <= snapshot_.chromas.size() &&
            snapshot_.chromas[chromaIndex_ - 1].id == *snapshot_.chromaId) {
            caption += " " + snapshot_.chromas[chromaIndex_ - 1].name;
        }
        if (snapshot_.chromaResolving) {
            caption += " (resolving)";
        }
    }
    if (snapshot_.alternateFormActive && snapshot_.alternateFormLabel) {
        caption += " [" + *snapshot_.alternateFormLabel + "]";
    }
    if (snapshot_.offersVersions && snapshot_.versionIndex > 0 &&
        snapshot_.versionIndex <= snapshot_.versionLabels.size()) {
        caption += " - " + snapshot_.versionLabels[snapshot_.versionIndex - 1];
    }
    caption += fmt::format(" | {} fps", driver_->getFPS());

    device_->setWindowCaption(irr::core::stringw(caption.c_str()).c_str());
}

} // namespace Graphics
} // namespace CVW
