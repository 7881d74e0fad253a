#include <gtest/gtest.h>
#include "viewer/assets/asset_catalog.h"

#include <memory>

using CVW::Assets::AlternateForm;
using CVW::Assets::AssetCatalog;
using CVW::Assets::SizeOverride;

class AssetCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_ = AssetCatalog::defaults();
    }

    static Json::Value parse(const std::string& text) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errors;
        EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
        return root;
    }

    AssetCatalog catalog_;
};

TEST_F(AssetCatalogTest, Defaults_AlternateForms) {
    const AlternateForm* elise = catalog_.alternateForm("Elise");
    ASSERT_NE(elise, nullptr);
    EXPECT_EQ(elise->kind, AlternateForm::Kind::Model);
    EXPECT_EQ(elise->alias, "elisespider");

    const AlternateForm* belveth = catalog_.alternateForm("Belveth");
    ASSERT_NE(belveth, nullptr);
    EXPECT_EQ(belveth->kind, AlternateForm::Kind::Texture);
    EXPECT_EQ(belveth->textureSegment, "belveth_ult");
    EXPECT_EQ(belveth->idleAnimation, "Spell4_Idle");

    EXPECT_EQ(catalog_.alternateForm("Annie"), nullptr);
}

TEST_F(AssetCatalogTest, Defaults_CompanionsAndExtras) {
    ASSERT_EQ(catalog_.companionAliases("Annie").size(), 1u);
    EXPECT_EQ(catalog_.companionAliases("Annie")[0], "annietibbers");
    EXPECT_TRUE(catalog_.companionAliases("Ashe").empty());

    const auto& azir = catalog_.extraModels("Azir");
    ASSERT_EQ(azir.size(), 2u);
    EXPECT_EQ(azir[0].aliases[0], "azirsoldier");
    EXPECT_FLOAT_EQ(azir[1].scaleMultiplier, 2.1f);

    auto offset = catalog_.mainModelOffset("Azir");
    ASSERT_TRUE(offset.has_value());
    EXPECT_FLOAT_EQ(offset->x, -0.6f);
    EXPECT_FALSE(catalog_.mainModelOffset("Bard").has_value());

    EXPECT_TRUE(catalog_.modelVersions("Annie").empty());
}

TEST_F(AssetCatalogTest, DefaultIdle_SpecificKeyWins) {
    EXPECT_EQ(catalog_.defaultIdleAnimation("ahri", 103089).value_or(""), "idle.SKINS_Ahri_Skin89");
    EXPECT_EQ(catalog_.defaultIdleAnimation("ahri", 103001).value_or(""), "Idle1");
    EXPECT_EQ(catalog_.defaultIdleAnimation("Annie", 1000).value_or(""), "Annie_2012_idle1.anm");
    EXPECT_EQ(catalog_.defaultIdleAnimation("fiddlesticks", 9000).value_or(""), "IdleA");
    EXPECT_FALSE(catalog_.defaultIdleAnimation("nosuchchampion", 1).has_value());
}

TEST_F(AssetCatalogTest, DefaultIdle_AliasBeforeSkinId) {
    AssetCatalog c;
    c.setIdleAnimation("1000", "ByskinId");
    c.setIdleAnimation("annie", "ByAlias");
    EXPECT_EQ(c.defaultIdleAnimation("annie", 1000).value_or(""), "ByAlias");
    EXPECT_EQ(c.defaultIdleAnimation("other", 1000).value_or(""), "ByskinId");
}

TEST_F(AssetCatalogTest, PreferredIdle_ByAliasIgnoringCase) {
    EXPECT_EQ(catalog_.preferredIdleAnimation("fiddlesticks").value_or(""), "Fiddlesticks_Idle2_Loop");
    EXPECT_EQ(catalog_.preferredIdleAnimation("FiddleSticks").value_or(""), "Fiddlesticks_Idle2_Loop");
    EXPECT_FALSE(catalog_.preferredIdleAnimation("annie").has_value());

    Json::Value json = parse(R"({ "preferredIdleAnimations": { "Annie": "Annie_Idle2", "ashe": 3, "ezreal": "" } })");
    EXPECT_FALSE(catalog_.loadJson(json));
    EXPECT_EQ(catalog_.preferredIdleAnimation("annie").value_or(""), "Annie_Idle2");
    EXPECT_FALSE(catalog_.preferredIdleAnimation("ashe").has_value());
    EXPECT_FALSE(catalog_.preferredIdleAnimation("ezreal").has_value());
}

TEST_F(AssetCatalogTest, SizeOverride_SkinIdBeforeAlias) {
    AssetCatalog c;
    c.setSizeOverride("annie", SizeOverride{2.0f, 0.0f, 0.0f, 0.0f});
    c.setSizeOverride("1005", SizeOverride{3.0f, 0.1f, 0.0f, 0.0f});
    c.setSizeOverride("annie/1007", SizeOverride{4.0f, 0.0f, 0.0f, 0.0f});

    EXPECT_FLOAT_EQ(c.sizeOverride("annie", 1007).scale, 4.0f);
    EXPECT_FLOAT_EQ(c.sizeOverride("annie", 1005).scale, 3.0f);
    EXPECT_FLOAT_EQ(c.sizeOverride("annie", 1005).xShift, 0.1f);
    EXPECT_FLOAT_EQ(c.sizeOverride("Annie", 1001).scale, 2.0f);
    EXPECT_FLOAT_EQ(c.sizeOverride("ashe", 22000).scale, 1.0f);
}

TEST_F(AssetCatalogTest, SizeOverride_ReplacesChampionScale) {
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("ziggs", 115000).scale, 0.3f);

    catalog_.setSizeOverride("ziggs/115001", SizeOverride{2.0f, 0.1f, 0.0f, 0.0f});
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("ziggs", 115001).scale, 2.0f);
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("ziggs", 115001).xShift, 0.1f);
    // Other skins still use the champion scale
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("ziggs", 115002).scale, 0.3f);
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("ziggs", 115002).xShift, 0.0f);
}

TEST_F(AssetCatalogTest, LoadJson_MergesTables) {
    Json::Value json = parse(R"({
        "alternateForms": {
            "Jayce": { "alias": "jaycecannon", "label": "Cannon" }
        },
        "modelVersions": {
            "Annie": [
                { "label": "Classic 2012", "segment": "legacy", "idleAnimation": "Idle1", "texture": true },
                { "segment": "beta" }
            ]
        },
        "extraModels": {
            "Yorick": [ { "aliases": ["yorickghoul"], "offset": [1.0, 0.0, 0.5], "scale": 0.5 } ]
        },
        "mainModelOffsets": { "Yorick": [0.2, 0.0, 0.0] },
        "idleAnimations": { "Yorick": "Idle_Base" },
        "sizeOverrides": { "yorick/83000": { "scale": 1.2, "yShift": -0.1 } }
    })");

    EXPECT_TRUE(catalog_.loadJson(json));

    const AlternateForm* jayce = catalog_.alternateForm("Jayce");
    ASSERT_NE(jayce, nullptr);
    EXPECT_EQ(jayce->alias, "jaycecannon");
    EXPECT_EQ(jayce->kind, AlternateForm::Kind::Model);

    const auto& versions = catalog_.modelVersions("Annie");
    ASSERT_EQ(versions.size(), 2u);
    EXPECT_EQ(versions[0].label, "Classic 2012");
    EXPECT_TRUE(versions[0].hasTexture);
    EXPECT_EQ(versions[1].label, "beta");
    EXPECT_FALSE(versions[1].hasTexture);

    ASSERT_EQ(catalog_.extraModels("Yorick").size(), 1u);
    EXPECT_FLOAT_EQ(catalog_.extraModels("Yorick")[0].positionOffset.z, 0.5f);
    EXPECT_FLOAT_EQ(catalog_.mainModelOffset("Yorick")->x, 0.2f);
    EXPECT_EQ(catalog_.defaultIdleAnimation("yorick", 83000).value_or(""), "Idle_Base");
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("yorick", 83000).yShift, -0.1f);

    // Built-ins untouched
    EXPECT_NE(catalog_.alternateForm("Elise"), nullptr);
}

TEST_F(AssetCatalogTest, LoadJson_SkipsMalformedEntries) {
    Json::Value json = parse(R"({
        "alternateForms": { "Broken": { "label": "No alias" } },
        "companions": { "Ivern": "ivernminion", "Zyra": ["zyraplant"] },
        "mainModelOffsets": { "Azir": [1.0, 2.0] },
        "sizeOverrides": { "annie": { "scale": 0 } },
        "championScales": { "teemo": -1 }
    })");

    EXPECT_FALSE(catalog_.loadJson(json));

    EXPECT_EQ(catalog_.alternateForm("Broken"), nullptr);
    EXPECT_TRUE(catalog_.companionAliases("Ivern").empty());
    ASSERT_EQ(catalog_.companionAliases("Zyra").size(), 1u);
    // Previous value kept
    EXPECT_FLOAT_EQ(catalog_.mainModelOffset("Azir")->x, -0.6f);
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("annie", 1000).scale, 1.0f);
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("teemo", 17000).scale, 1.0f);
}

TEST_F(AssetCatalogTest, LoadJson_WrongTableTypesAreSkipped) {
    Json::Value json = parse(R"({
        "companions": [],
        "alternateForms": "Elise",
        "championScales": { "kled": 0.9 }
    })");

    EXPECT_FALSE(catalog_.loadJson(json));

    // Built-ins untouched, valid tables still merged
    EXPECT_EQ(catalog_.companionAliases("Annie")[0], "annietibbers");
    ASSERT_NE(catalog_.alternateForm("Elise"), nullptr);
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("kled", 240000).scale, 0.9f);
}

TEST_F(AssetCatalogTest, LoadJson_WrongElementTypesAreSkipped) {
    Json::Value json = parse(R"({
        "modelVersions": {
            "Ahri": ["old"],
            "Ashe": [ { "segment": "legacy", "texture": "yes" }, { "segment": "classic", "label": 3 },
                      { "segment": "base", "label": "Base" } ]
        },
        "extraModels": { "Bard": [ "bardmeep", { "aliases": ["bardmeep"], "scale": "big" } ] },
        "alternateForms": { "Jayce": { "alias": ["jaycecannon"] } },
        "sizeOverrides": { "annie": { "scale": 1.5, "xShift": "left" } }
    })");

    EXPECT_FALSE(catalog_.loadJson(json));

    EXPECT_TRUE(catalog_.modelVersions("Ahri").empty());
    ASSERT_EQ(catalog_.modelVersions("Ashe").size(), 1u);
    EXPECT_EQ(catalog_.modelVersions("Ashe")[0].label, "Base");
    EXPECT_TRUE(catalog_.extraModels("Bard").empty());
    EXPECT_EQ(catalog_.alternateForm("Jayce"), nullptr);
    EXPECT_FLOAT_EQ(catalog_.sizeOverride("annie", 1000).scale, 1.0f);
}

TEST_F(AssetCatalogTest, LoadJson_NullIsNoop) {
    EXPECT_TRUE(catalog_.loadJson(Json::Value()));
    EXPECT_FALSE(catalog_.loadJson(Json::Value("not an object")));
}
