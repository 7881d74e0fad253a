#include <gtest/gtest.h>
#include "asset_test_fakes.h"
#include "viewer/assets/asset_urls.h"
#include "viewer/assets/variant_orchestrator.h"

#include <memory>
#include <vector>

using namespace CVW::Assets;

namespace {

const SubjectRef kAnnie{"Annie", 1};
const SubjectRef kAshe{"Ashe", 22};
const SubjectRef kElise{"Elise", 60};
const SubjectRef kAzir{"Azir", 268};
const SubjectRef kBelveth{"Belveth", 200};

std::string model(const std::string& alias, uint32_t skinId) {
    return "https://m/lol/models/" + alias + "/" + std::to_string(skinId) + "/model.glb";
}

std::string chromaMirror(const std::string& alias, uint32_t chromaId) {
    const std::string num = chromaNumber(chromaId);
    return "https://raw/latest/game/assets/characters/" + alias + "/skins/skin" + num + "/" + alias +
           "_skin" + num + "_tx_cm.png";
}

} // namespace

class VariantOrchestratorTest : public ::testing::Test {
protected:
    VariantOrchestratorTest()
        : catalog_(AssetCatalog::defaults())
        , urls_(makeHosts(), UrlTemplates())
        , generator_(catalog_, urls_)
        , prober_(true)
        , resolver_(prober_) {}

    static AssetHosts makeHosts() {
        AssetHosts hosts;
        hosts.modelHost = "https://m";
        hosts.rawHost = "https://raw";
        return hosts;
    }

    // Built lazily so tests can adjust the catalog first
    VariantOrchestrator& orchestrator(IChromaListSource* chromaLists = nullptr) {
        if (!orchestrator_) {
            orchestrator_ = std::make_unique<VariantOrchestrator>(generator_, resolver_, chromaLists);
            orchestrator_->setChangeListener([this](const RenderSnapshot& s) { snapshots_.push_back(s); });
        }
        return *orchestrator_;
    }

    AssetCatalog catalog_;
    AssetUrls urls_;
    CandidateGenerator generator_;
    FakeAssetProber prober_;
    ProbeResolver resolver_;
    std::unique_ptr<VariantOrchestrator> orchestrator_;
    std::vector<RenderSnapshot> snapshots_;
};

TEST_F(VariantOrchestratorTest, PlainSkin_DefaultModelAndSingleNotification) {
    orchestrator().selectSkin(kAshe, 3);

    ASSERT_EQ(snapshots_.size(), 1u);
    const RenderSnapshot& s = snapshots_.back();
    EXPECT_EQ(s.subject, kAshe);
    EXPECT_EQ(s.skinId, 22003u);
    EXPECT_EQ(s.modelUrl, model("ashe", 22003));
    EXPECT_EQ(s.modelAlias, "ashe");
    EXPECT_EQ(s.modelSkinId, 22003u);
    EXPECT_FALSE(s.textureUrl.has_value());
    EXPECT_FALSE(s.companionModelUrl.has_value());
    EXPECT_TRUE(s.extraModels.empty());
    EXPECT_FALSE(s.offersAlternateForm);
    EXPECT_FALSE(s.offersVersions);
    EXPECT_EQ(s.nextVersionLabel, "alternate");
    EXPECT_EQ(s.defaultIdle.value_or(""), "Idle1");
    EXPECT_TRUE(s.settled);
    EXPECT_TRUE(prober_.probed.empty());
}

TEST_F(VariantOrchestratorTest, Chroma_ResolvesPrimaryAndCompanion) {
    prober_.existing = {
        chromaMirror("annie", 1012),
        model("annietibbers", 1000),
    };
    orchestrator().selectSkin(kAnnie, 0);
    orchestrator().selectChroma(1012u);

    EXPECT_TRUE(orchestrator().snapshot().chromaResolving);
    EXPECT_FALSE(orchestrator().isSettled());

    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_TRUE(s.settled);
    EXPECT_FALSE(s.chromaResolving);
    EXPECT_EQ(s.chromaId.value_or(0), 1012u);
    EXPECT_EQ(s.textureUrl.value_or(""), chromaMirror("annie", 1012));
    EXPECT_EQ(s.companionModelUrl.value_or(""), model("annietibbers", 1000));
    // No tibbers chroma exists
    EXPECT_FALSE(s.companionTextureUrl.has_value());
}

TEST_F(VariantOrchestratorTest, Chroma_LatestSelectionWins) {
    prober_.existing = {chromaMirror("ashe", 22011), chromaMirror("ashe", 22012)};
    orchestrator().selectSkin(kAshe, 0);
    orchestrator().selectChroma(22011u);
    orchestrator().selectChroma(22012u);

    // The newer lookup answers first, the older one afterwards
    ASSERT_TRUE(prober_.answer(chromaMirror("ashe", 22012)));
    ASSERT_TRUE(prober_.answer(chromaMirror("ashe", 22011)));
    prober_.answerAll();

    EXPECT_EQ(orchestrator().snapshot().textureUrl.value_or(""), chromaMirror("ashe", 22012));
    for (const auto& s : snapshots_) {
        EXPECT_NE(s.textureUrl.value_or(""), chromaMirror("ashe", 22011));
    }
    EXPECT_EQ(orchestrator().cachedChromaCount(), 1u);
}

TEST_F(VariantOrchestratorTest, Chroma_CacheAvoidsSecondProbe) {
    prober_.existing = {chromaMirror("ashe", 22012)};
    orchestrator().selectSkin(kAshe, 0);
    orchestrator().selectChroma(22012u);
    prober_.answerAll();
    ASSERT_EQ(orchestrator().cachedChromaCount(), 1u);

    orchestrator().selectChroma(std::nullopt);
    EXPECT_FALSE(orchestrator().snapshot().textureUrl.has_value());

    const size_t probesBefore = prober_.probed.size();
    orchestrator().selectChroma(22012u);
    EXPECT_EQ(prober_.probed.size(), probesBefore);
    EXPECT_EQ(orchestrator().snapshot().textureUrl.value_or(""), chromaMirror("ashe", 22012));

    orchestrator().clearChromaCache();
    EXPECT_EQ(orchestrator().cachedChromaCount(), 0u);
    orchestrator().selectChroma(std::nullopt);
    orchestrator().selectChroma(22012u);
    EXPECT_GT(prober_.probed.size(), probesBefore);
}

TEST_F(VariantOrchestratorTest, Chroma_Exhausted_KeepsBaseTexture) {
    orchestrator().selectSkin(kAshe, 0);
    orchestrator().selectChroma(22099u);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_FALSE(s.textureUrl.has_value());
    EXPECT_TRUE(s.settled);
    EXPECT_EQ(orchestrator().cachedChromaCount(), 0u);
}

TEST_F(VariantOrchestratorTest, ChromaBeforeSkin_IsIgnored) {
    orchestrator().selectChroma(1012u);
    EXPECT_TRUE(snapshots_.empty());
    EXPECT_TRUE(prober_.probed.empty());
}

TEST_F(VariantOrchestratorTest, AlternateFormModel_FallsBackToBaseSkin) {
    prober_.existing = {model("elisespider", 60000)};
    orchestrator().selectSkin(kElise, 4);
    EXPECT_TRUE(orchestrator().snapshot().offersAlternateForm);

    orchestrator().setAlternateForm(true);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_TRUE(s.alternateFormActive);
    EXPECT_EQ(s.alternateFormLabel.value_or(""), "Spider Form");
    EXPECT_EQ(s.modelUrl, model("elisespider", 60000));
    EXPECT_EQ(s.modelAlias, "elisespider");
    EXPECT_EQ(s.modelSkinId, 60000u);
    EXPECT_EQ(prober_.probed, (std::vector<std::string>{model("elisespider", 60004), model("elisespider", 60000)}));

    orchestrator().toggleAlternateForm();
    s = orchestrator().snapshot();
    EXPECT_FALSE(s.alternateFormActive);
    EXPECT_EQ(s.modelUrl, model("elise", 60004));
}

TEST_F(VariantOrchestratorTest, AlternateFormModel_MissingKeepsDefault) {
    orchestrator().selectSkin(kElise, 4);
    orchestrator().setAlternateForm(true);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_TRUE(s.alternateFormActive);
    EXPECT_EQ(s.modelUrl, model("elise", 60004));
}

TEST_F(VariantOrchestratorTest, AlternateFormTexture_WithIdleOverride) {
    const std::string texture = "https://m/lol/models/belveth/200000/belveth_ult.webp";
    prober_.existing = {texture};
    orchestrator().selectSkin(kBelveth, 0);
    orchestrator().setAlternateForm(true);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_EQ(s.modelUrl, model("belveth", 200000));
    EXPECT_EQ(s.textureUrl.value_or(""), texture);
    EXPECT_EQ(s.idleOverride.value_or(""), "Spell4_Idle");
}

TEST_F(VariantOrchestratorTest, AlternateForm_NotOfferedIsIgnored) {
    orchestrator().selectSkin(kAshe, 0);
    orchestrator().setAlternateForm(true);
    EXPECT_FALSE(orchestrator().snapshot().alternateFormActive);
    EXPECT_TRUE(prober_.probed.empty());
}

TEST_F(VariantOrchestratorTest, SkinChange_ResetsAxes) {
    prober_.existing = {model("elisespider", 60004), chromaMirror("elise", 60005)};
    orchestrator().selectSkin(kElise, 4);
    orchestrator().setAlternateForm(true);
    orchestrator().selectChroma(60005u);
    prober_.answerAll();
    ASSERT_TRUE(orchestrator().snapshot().alternateFormActive);

    orchestrator().selectSkin(kElise, 1);

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_FALSE(s.alternateFormActive);
    EXPECT_FALSE(s.chromaId.has_value());
    EXPECT_FALSE(s.textureUrl.has_value());
    EXPECT_EQ(s.modelUrl, model("elise", 60001));
    EXPECT_EQ(s.versionIndex, 0u);
}

TEST_F(VariantOrchestratorTest, SkinChange_DropsLateFormAnswer) {
    prober_.existing = {model("elisespider", 60004)};
    orchestrator().selectSkin(kElise, 4);
    orchestrator().setAlternateForm(true);
    ASSERT_TRUE(prober_.isPending(model("elisespider", 60004)));

    orchestrator().selectSkin(kElise, 1);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_EQ(s.modelUrl, model("elise", 60001));
    EXPECT_FALSE(s.alternateFormActive);
    for (const auto& snap : snapshots_) {
        EXPECT_NE(snap.modelUrl, model("elisespider", 60004));
    }
}

TEST_F(VariantOrchestratorTest, ChromaChange_PreservesForm) {
    prober_.existing = {model("elisespider", 60004)};
    orchestrator().selectSkin(kElise, 4);
    orchestrator().setAlternateForm(true);
    prober_.answerAll();

    orchestrator().selectChroma(60007u);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_TRUE(s.alternateFormActive);
    EXPECT_EQ(s.modelUrl, model("elisespider", 60004));
}

TEST_F(VariantOrchestratorTest, HistoricalVersions_CycleThroughResolvedOnes) {
    catalog_.setModelVersions("Ashe", {
        {"Classic", "legacy", "Idle_Old", true},
        {"Beta", "beta", "", false},
    });
    const std::string legacyModel = "https://m/lol/models/ashe/22000/legacy/model.glb";
    const std::string legacyTexture = "https://m/lol/models/ashe/22000/legacy/texture.webp";
    prober_.existing = {legacyModel, legacyTexture};

    orchestrator().selectSkin(kAshe, 1);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_TRUE(s.settled);
    EXPECT_EQ(s.versionLabels, (std::vector<std::string>{"Classic"}));
    EXPECT_TRUE(s.offersVersions);
    EXPECT_EQ(s.versionIndex, 0u);
    EXPECT_EQ(s.nextVersionLabel, "Classic");
    EXPECT_EQ(s.modelUrl, model("ashe", 22001));

    orchestrator().cycleVersion();
    s = orchestrator().snapshot();
    EXPECT_EQ(s.versionIndex, 1u);
    EXPECT_EQ(s.modelUrl, legacyModel);
    EXPECT_EQ(s.modelSkinId, 22000u);
    EXPECT_EQ(s.textureUrl.value_or(""), legacyTexture);
    EXPECT_EQ(s.idleOverride.value_or(""), "Idle_Old");
    EXPECT_EQ(s.nextVersionLabel, "current");

    orchestrator().cycleVersion();
    s = orchestrator().snapshot();
    EXPECT_EQ(s.versionIndex, 0u);
    EXPECT_EQ(s.modelUrl, model("ashe", 22001));
    EXPECT_FALSE(s.idleOverride.has_value());

    orchestrator().setVersionIndex(5);
    EXPECT_EQ(orchestrator().snapshot().versionIndex, 0u);
    orchestrator().setVersionIndex(1);
    EXPECT_EQ(orchestrator().snapshot().versionIndex, 1u);
}

TEST_F(VariantOrchestratorTest, HistoricalVersions_NoneResolved) {
    catalog_.setModelVersions("Ashe", {{"Classic", "legacy", "", false}});
    orchestrator().selectSkin(kAshe, 1);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_FALSE(s.offersVersions);
    EXPECT_EQ(s.nextVersionLabel, "alternate");
    orchestrator().cycleVersion();
    EXPECT_EQ(orchestrator().snapshot().versionIndex, 0u);
}

TEST_F(VariantOrchestratorTest, ExtraModels_WithPlacement) {
    prober_.existing = {model("azir_soldier", 268000), model("sundisc", 268000)};
    orchestrator().selectSkin(kAzir, 0);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    ASSERT_EQ(s.extraModels.size(), 2u);
    EXPECT_EQ(s.extraModels[0].url, model("azir_soldier", 268000));
    EXPECT_FLOAT_EQ(s.extraModels[0].positionOffset.x, 0.9f);
    EXPECT_EQ(s.extraModels[1].url, model("sundisc", 268000));
    EXPECT_FLOAT_EQ(s.extraModels[1].scaleMultiplier, 2.1f);
    ASSERT_TRUE(s.mainModelOffset.has_value());
    EXPECT_FLOAT_EQ(s.mainModelOffset->x, -0.6f);
}

TEST_F(VariantOrchestratorTest, Companion_HidesFormAndVersionOffers) {
    catalog_.setModelVersions("Annie", {{"Classic", "legacy", "", false}});
    prober_.existing = {model("annietibbers", 1000), "https://m/lol/models/annie/1000/legacy/model.glb"};
    orchestrator().selectSkin(kAnnie, 0);
    prober_.answerAll();

    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_TRUE(s.companionModelUrl.has_value());
    EXPECT_FALSE(s.offersVersions);
    EXPECT_FALSE(s.offersAlternateForm);
}

TEST_F(VariantOrchestratorTest, SubjectChange_RebuildsAxes) {
    prober_.existing = {model("azir_soldier", 268000)};
    orchestrator().selectSkin(kAzir, 0);
    prober_.answerAll();
    ASSERT_EQ(orchestrator().snapshot().extraModels.size(), 1u);

    orchestrator().selectSkin(kAshe, 0);
    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_TRUE(s.extraModels.empty());
    EXPECT_FALSE(s.mainModelOffset.has_value());
    EXPECT_EQ(s.subject, kAshe);
}

namespace {

SkinChromaMap annieChromas() {
    SkinChromaMap map;
    map[1001] = {{1012, "Ruby", {"#D33528"}}, {1013, "Pearl", {"#ECF9F8"}}};
    map[1005] = {{1020, "Obsidian", {"#2B2B2B"}}};
    return map;
}

} // namespace

TEST_F(VariantOrchestratorTest, ChromaList_FetchedOncePerCharacter) {
    FakeChromaListSource lists(true);
    lists.lists["Annie"] = annieChromas();

    orchestrator(&lists).selectSkin(kAnnie, 1);
    EXPECT_TRUE(orchestrator().snapshot().chromaListLoading);
    EXPECT_FALSE(orchestrator().isSettled());

    ASSERT_TRUE(lists.finish("Annie"));
    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_FALSE(s.chromaListLoading);
    EXPECT_TRUE(orchestrator().isSettled());
    ASSERT_EQ(s.chromas.size(), 2u);
    EXPECT_EQ(s.chromas[0].id, 1012u);
    EXPECT_EQ(s.chromas[1].name, "Pearl");
    EXPECT_EQ(snapshots_.back().chromas.size(), 2u);

    orchestrator().selectSkin(kAnnie, 5);
    EXPECT_EQ(lists.fetched.size(), 1u);
    ASSERT_EQ(orchestrator().snapshot().chromas.size(), 1u);
    EXPECT_EQ(orchestrator().snapshot().chromas[0].id, 1020u);

    // Skins without chromas offer none
    orchestrator().selectSkin(kAnnie, 2);
    EXPECT_TRUE(orchestrator().snapshot().chromas.empty());
    EXPECT_EQ(orchestrator().cachedChromaListCount(), 1u);
}

TEST_F(VariantOrchestratorTest, ChromaList_FailureIsNotKept) {
    FakeChromaListSource lists;
    orchestrator(&lists).selectSkin(kAshe, 0);
    EXPECT_TRUE(orchestrator().snapshot().chromas.empty());
    EXPECT_EQ(orchestrator().cachedChromaListCount(), 0u);

    lists.lists["Ashe"][22000] = {{22011, "Amethyst", {}}};
    orchestrator().selectSkin(kAshe, 0);
    EXPECT_EQ(lists.fetched.size(), 2u);
    EXPECT_EQ(orchestrator().snapshot().chromas.size(), 1u);
}

TEST_F(VariantOrchestratorTest, ChromaList_OfPreviousCharacterDropped) {
    FakeChromaListSource lists(true);
    lists.lists["Annie"] = annieChromas();
    lists.lists["Ashe"][22000] = {{22011, "Amethyst", {}}};

    orchestrator(&lists).selectSkin(kAnnie, 1);
    orchestrator().selectSkin(kAshe, 0);
    EXPECT_EQ(lists.fetched, (std::vector<std::string>{"Annie", "Ashe"}));

    ASSERT_TRUE(lists.finish("Annie"));
    EXPECT_EQ(orchestrator().cachedChromaListCount(), 0u);
    EXPECT_TRUE(orchestrator().snapshot().chromaListLoading);

    ASSERT_TRUE(lists.finish("Ashe"));
    EXPECT_EQ(orchestrator().cachedChromaListCount(), 1u);
    ASSERT_EQ(orchestrator().snapshot().chromas.size(), 1u);
    EXPECT_EQ(orchestrator().snapshot().chromas[0].id, 22011u);
}

TEST_F(VariantOrchestratorTest, ChromaList_ClearRefetchesCurrentCharacter) {
    FakeChromaListSource lists;
    lists.lists["Annie"] = annieChromas();

    orchestrator(&lists).selectSkin(kAnnie, 1);
    ASSERT_EQ(orchestrator().cachedChromaListCount(), 1u);

    lists.lists["Annie"][1001].push_back({1014, "Sapphire", {}});
    orchestrator().clearChromaListCache();
    EXPECT_EQ(lists.fetched.size(), 2u);
    EXPECT_EQ(orchestrator().cachedChromaListCount(), 1u);
    EXPECT_EQ(orchestrator().snapshot().chromas.size(), 3u);
    EXPECT_EQ(snapshots_.back().chromas.size(), 3u);
}

TEST_F(VariantOrchestratorTest, PreferredIdleInSnapshot) {
    orchestrator().selectSkin(SubjectRef{"Fiddlesticks", 9}, 0);
    RenderSnapshot s = orchestrator().snapshot();
    EXPECT_EQ(s.preferredIdle.value_or(""), "Fiddlesticks_Idle2_Loop");
    EXPECT_EQ(s.defaultIdle.value_or(""), "IdleA");

    orchestrator().selectSkin(kAshe, 0);
    EXPECT_FALSE(orchestrator().snapshot().preferredIdle.has_value());
}
