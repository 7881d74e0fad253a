#include <gtest/gtest.h>
#include <json/json.h>
#include "common/logging.h"
#include "common/util/json_config.h"
#include "viewer/viewer_config.h"

#include <cstdio>
#include <fstream>
#include <string>

class JsonConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(JsonConfigFileTest, Load_MissingFile_IsEmptyButOk) {
    auto file = CVW::JsonConfigFile::Load("/nonexistent/champview.json");
    EXPECT_FALSE(file.Exists());
    EXPECT_TRUE(file.Ok());
    EXPECT_EQ(file.GetVariableInt("probe", "timeoutMs", 42), 42);
}

TEST_F(JsonConfigFileTest, Parse_Malformed_SetsError) {
    auto file = CVW::JsonConfigFile::Parse("{ \"probe\": ");
    EXPECT_FALSE(file.Ok());
    EXPECT_FALSE(file.Error().empty());
}

TEST_F(JsonConfigFileTest, Parse_NonObject_SetsError) {
    auto file = CVW::JsonConfigFile::Parse("[1, 2, 3]");
    EXPECT_FALSE(file.Ok());
}

TEST_F(JsonConfigFileTest, GetVariable_TypedLookups) {
    auto file = CVW::JsonConfigFile::Parse(R"({
        "probe": { "timeoutMs": 2500, "cacheResults": false },
        "hosts": { "modelHost": "https://models.example" },
        "normalizer": { "targetHeight": 2.5 }
    })");
    ASSERT_TRUE(file.Ok());
    EXPECT_TRUE(file.Exists());
    EXPECT_EQ(file.GetVariableInt("probe", "timeoutMs", 0), 2500);
    EXPECT_FALSE(file.GetVariableBool("probe", "cacheResults", true));
    EXPECT_EQ(file.GetVariableString("hosts", "modelHost", ""), "https://models.example");
    EXPECT_DOUBLE_EQ(file.GetVariableDouble("normalizer", "targetHeight", 0.0), 2.5);
}

TEST_F(JsonConfigFileTest, GetVariable_WrongTypeFallsBack) {
    auto file = CVW::JsonConfigFile::Parse(R"({ "probe": { "timeoutMs": "fast", "cacheResults": 1 } })");
    ASSERT_TRUE(file.Ok());
    EXPECT_EQ(file.GetVariableInt("probe", "timeoutMs", 15000), 15000);
    EXPECT_TRUE(file.GetVariableBool("probe", "cacheResults", true));
    EXPECT_EQ(file.GetVariableString("missing", "value", "dflt"), "dflt");
}

class ViewerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        SetLogLevel(LOG_NONE);
        for (int i = 0; i < MOD_COUNT; i++) {
            SetModuleLogLevel(static_cast<LogModule>(i), -1);
        }
    }

    void TearDown() override {
        SetLogLevel(LOG_NONE);
        if (!tempPath_.empty()) {
            std::remove(tempPath_.c_str());
        }
    }

    std::string writeTemp(const std::string& contents) {
        tempPath_ = ::testing::TempDir() + "cvw_viewer_config_test.json";
        std::ofstream out(tempPath_);
        out << contents;
        return tempPath_;
    }

    std::string tempPath_;
};

TEST_F(ViewerConfigTest, Defaults) {
    CVW::ViewerConfig config;
    EXPECT_EQ(config.hosts().modelHost, "https://cdn.modelviewer.lol");
    EXPECT_TRUE(config.hosts().blobHost.empty());
    EXPECT_EQ(config.probe().timeoutMs, 15000);
    EXPECT_TRUE(config.probe().cacheResults);
    EXPECT_EQ(config.art().loadTimeoutMs, 4000u);
    EXPECT_FLOAT_EQ(config.normalizer().targetHeight, 3.4f);
    EXPECT_FLOAT_EQ(config.normalizer().baselineY, -1.7f);
    EXPECT_FALSE(config.normalizer().useBodyJoints);

    // Built-in catalog is present
    ASSERT_NE(config.catalog().alternateForm("Elise"), nullptr);
    EXPECT_EQ(config.catalog().companionAliases("Annie").size(), 1u);
}

TEST_F(ViewerConfigTest, Load_MissingFile_KeepsDefaults) {
    CVW::ViewerConfig config;
    EXPECT_TRUE(config.load("/nonexistent/champview.json"));
    EXPECT_EQ(config.probe().timeoutMs, 15000);
    EXPECT_EQ(config.path(), "/nonexistent/champview.json");
}

TEST_F(ViewerConfigTest, Load_MalformedFile_ReturnsFalse) {
    CVW::ViewerConfig config;
    EXPECT_FALSE(config.load(writeTemp("{ not json")));
    EXPECT_EQ(config.probe().timeoutMs, 15000);
}

TEST_F(ViewerConfigTest, Load_FileOverridesSections) {
    CVW::ViewerConfig config;
    ASSERT_TRUE(config.load(writeTemp(R"({
        "hosts": { "modelHost": "https://models.example/", "blobHost": "https://blob.example" },
        "urlTemplates": { "splash": "{artHost}/splash/{id}/{skinNum}.jpg" },
        "probe": { "timeoutMs": 3000, "cacheResults": false },
        "art": { "loadTimeoutMs": 1500 },
        "normalizer": { "targetHeight": 2.0, "useBodyJoints": true, "minBodyJoints": 6 }
    })")));

    EXPECT_EQ(config.hosts().modelHost, "https://models.example/");
    EXPECT_EQ(config.hosts().blobHost, "https://blob.example");
    EXPECT_EQ(config.urlTemplates().splash, "{artHost}/splash/{id}/{skinNum}.jpg");
    // Untouched templates keep their defaults
    EXPECT_EQ(config.urlTemplates().model, CVW::Assets::UrlTemplates().model);
    EXPECT_EQ(config.probe().timeoutMs, 3000);
    EXPECT_FALSE(config.probe().cacheResults);
    EXPECT_EQ(config.art().loadTimeoutMs, 1500u);
    EXPECT_FLOAT_EQ(config.normalizer().targetHeight, 2.0f);
    EXPECT_TRUE(config.normalizer().useBodyJoints);
    EXPECT_EQ(config.normalizer().minBodyJoints, 6u);
}

TEST_F(ViewerConfigTest, OutOfRangeValuesAreClamped) {
    CVW::ViewerConfig config;
    ASSERT_TRUE(config.loadFromString(R"({
        "probe": { "timeoutMs": 10 },
        "art": { "loadTimeoutMs": 999999 },
        "normalizer": { "targetHeight": -5.0, "iqrFactor": 50.0, "minBodyJoints": 0 }
    })"));

    EXPECT_EQ(config.probe().timeoutMs, 500);
    EXPECT_EQ(config.art().loadTimeoutMs, 30000u);
    EXPECT_FLOAT_EQ(config.normalizer().targetHeight, 0.1f);
    EXPECT_FLOAT_EQ(config.normalizer().iqrFactor, 10.0f);
    EXPECT_EQ(config.normalizer().minBodyJoints, 1u);
}

TEST_F(ViewerConfigTest, CatalogSectionMergesOverBuiltins) {
    CVW::ViewerConfig config;
    ASSERT_TRUE(config.loadFromString(R"({
        "catalog": {
            "companions": { "Ivern": ["ivernminion"] },
            "championScales": { "Kled": 0.9 }
        }
    })"));

    ASSERT_EQ(config.catalog().companionAliases("Ivern").size(), 1u);
    EXPECT_EQ(config.catalog().companionAliases("Ivern")[0], "ivernminion");
    // Built-ins survive
    EXPECT_EQ(config.catalog().companionAliases("Annie")[0], "annietibbers");
    EXPECT_FLOAT_EQ(config.catalog().sizeOverride("kled", 240000).scale, 0.9f);
}

TEST_F(ViewerConfigTest, MalformedCatalogTablesDoNotAbortLoad) {
    CVW::ViewerConfig config;
    ASSERT_TRUE(config.loadFromString(R"({
        "probe": { "timeoutMs": 2000 },
        "catalog": {
            "companions": [],
            "modelVersions": { "Ahri": ["old"] }
        }
    })"));

    EXPECT_EQ(config.probe().timeoutMs, 2000);
    EXPECT_EQ(config.catalog().companionAliases("Annie")[0], "annietibbers");
    EXPECT_TRUE(config.catalog().modelVersions("Ahri").empty());
}

TEST_F(ViewerConfigTest, ApplyLogging_SetsLevels) {
    CVW::ViewerConfig config;
    ASSERT_TRUE(config.loadFromString(R"({
        "logging": { "level": "INFO", "modules": { "PROBE": "TRACE" } }
    })"));

    config.applyLogging();

    EXPECT_EQ(GetLogLevel(), LOG_INFO);
    EXPECT_EQ(LogManager::Instance().GetModuleLevel(MOD_PROBE), LOG_TRACE);
}

TEST_F(ViewerConfigTest, ApplyLogging_WithoutSectionLeavesLevels) {
    SetLogLevel(LOG_WARN);
    CVW::ViewerConfig config;
    ASSERT_TRUE(config.loadFromString("{}"));

    config.applyLogging();

    EXPECT_EQ(GetLogLevel(), LOG_WARN);
}
