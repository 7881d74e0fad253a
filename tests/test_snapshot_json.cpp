#include <gtest/gtest.h>
#include "viewer/assets/snapshot_json.h"

using namespace CVW::Assets;

TEST(SnapshotJsonTest, UnsetOptionalsAreNull) {
    RenderSnapshot s;
    s.subject = {"Ashe", 22};
    s.skinId = 22000;
    s.modelUrl = "https://m/lol/models/ashe/22000/model.glb";
    s.nextVersionLabel = "alternate";

    Json::Value json = snapshotToJson(s);
    EXPECT_EQ(json["champion"].asString(), "Ashe");
    EXPECT_EQ(json["key"].asUInt(), 22u);
    EXPECT_EQ(json["modelUrl"].asString(), s.modelUrl);
    EXPECT_TRUE(json["chromaId"].isNull());
    EXPECT_TRUE(json["textureUrl"].isNull());
    EXPECT_TRUE(json["mainModelOffset"].isNull());
    EXPECT_EQ(json["extraModels"].size(), 0u);
    EXPECT_TRUE(json["preferredIdle"].isNull());
    EXPECT_EQ(json["chromas"].size(), 0u);
    EXPECT_EQ(json["versions"]["next"].asString(), "alternate");
    EXPECT_TRUE(json["settled"].asBool());
}

TEST(SnapshotJsonTest, ExtrasAndForm) {
    RenderSnapshot s;
    s.subject = {"Azir", 268};
    s.chromaId = 268003u;
    s.extraModels.push_back({"https://m/lol/models/sundisc/268000/model.glb", glm::vec3(0.15f, -0.1f, -3.4f), 2.1f});
    s.mainModelOffset = glm::vec3(-0.6f, 0.0f, -0.2f);
    s.alternateFormLabel = std::string("Spider Form");
    s.versionLabels = {"Classic"};
    s.versionIndex = 1;

    Json::Value json = snapshotToJson(s);
    EXPECT_EQ(json["chromaId"].asUInt(), 268003u);
    ASSERT_EQ(json["extraModels"].size(), 1u);
    EXPECT_FLOAT_EQ(json["extraModels"][0]["scale"].asFloat(), 2.1f);
    EXPECT_FLOAT_EQ(json["extraModels"][0]["offset"][2].asFloat(), -3.4f);
    EXPECT_FLOAT_EQ(json["mainModelOffset"][0].asFloat(), -0.6f);
    EXPECT_EQ(json["alternateForm"]["label"].asString(), "Spider Form");
    EXPECT_FALSE(json["alternateForm"]["active"].asBool());
    EXPECT_EQ(json["versions"]["labels"][0].asString(), "Classic");
    EXPECT_EQ(json["versions"]["index"].asUInt(), 1u);
}

TEST(SnapshotJsonTest, ChromasOnOffer) {
    RenderSnapshot s;
    s.subject = {"Annie", 1};
    s.skinId = 1001;
    s.preferredIdle = std::string("Annie_Idle2_Loop");
    s.chromas = {{1012, "Ruby", {"#D33528", "#D33528"}}, {1013, "Pearl", {}}};

    Json::Value json = snapshotToJson(s);
    EXPECT_EQ(json["preferredIdle"].asString(), "Annie_Idle2_Loop");
    ASSERT_EQ(json["chromas"].size(), 2u);
    EXPECT_EQ(json["chromas"][0]["id"].asUInt(), 1012u);
    EXPECT_EQ(json["chromas"][0]["name"].asString(), "Ruby");
    EXPECT_EQ(json["chromas"][0]["colors"][1].asString(), "#D33528");
    EXPECT_EQ(json["chromas"][1]["colors"].size(), 0u);
    EXPECT_FALSE(json["chromaListLoading"].asBool());
}
