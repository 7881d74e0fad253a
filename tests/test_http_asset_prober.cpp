#include <gtest/gtest.h>
#include "common/event/event_loop.h"
#include "common/net/http_client.h"
#include "viewer/assets/chroma_list.h"
#include "viewer/assets/directory_lister.h"
#include "viewer/assets/http_asset_prober.h"

#include <functional>
#include <optional>

using namespace CVW;

// Nothing listens on port 1 of the loopback interface, so these requests
// fail at the transport level without leaving the machine.
namespace {
const char* kRefusedUrl = "http://127.0.0.1:1/lol/models/ashe/22000/model.glb";
}

class HttpAssetProberTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!client_.IsReady()) {
            GTEST_SKIP() << "libcurl multi handle unavailable";
        }
        client_.SetTimeoutMs(2000);
    }

    void TearDown() override {
        EventLoop::Get().Process();
    }

    static void PumpUntil(const std::function<bool()>& done, int max_iterations = 2000) {
        for (int i = 0; i < max_iterations && !done(); ++i) {
            if (!EventLoop::Get().RunOnce()) {
                break;
            }
        }
    }

    HttpClient client_;
};

TEST_F(HttpAssetProberTest, TransportFailureIsMissingAndNotCached) {
    Assets::HttpAssetProber prober(client_);

    std::optional<Assets::ProbeOutcome> outcome;
    prober.probe(kRefusedUrl, [&](Assets::ProbeOutcome o) { outcome = o; });
    PumpUntil([&] { return outcome.has_value(); });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, Assets::ProbeOutcome::Missing);
    EXPECT_EQ(prober.cachedCount(), 0u);
    EXPECT_EQ(client_.InFlight(), 0u);
}

TEST_F(HttpAssetProberTest, ClientReportsTransportError) {
    std::optional<HttpResponse> response;
    HttpRequestId id = client_.Head(kRefusedUrl, [&](const HttpResponse& r) { response = r; });
    EXPECT_NE(id, 0u);
    PumpUntil([&] { return response.has_value(); });

    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response->TransportFailed());
    EXPECT_FALSE(response->Ok());
}

TEST_F(HttpAssetProberTest, FailedListingIsEmptyAndNotCached) {
    Assets::HttpDirectoryLister lister(client_);

    std::optional<std::vector<std::string>> files;
    lister.list("http://127.0.0.1:1/skins/skin12/", [&](std::vector<std::string> f) { files = std::move(f); });
    PumpUntil([&] { return files.has_value(); });

    ASSERT_TRUE(files.has_value());
    EXPECT_TRUE(files->empty());
    EXPECT_EQ(lister.cachedCount(), 0u);
}

TEST_F(HttpAssetProberTest, UnreachableChromaListIsNullopt) {
    Assets::AssetHosts hosts;
    hosts.rawHost = "http://127.0.0.1:1";
    Assets::AssetUrls urls(hosts, Assets::UrlTemplates());
    Assets::HttpChromaListSource source(client_, urls);

    bool called = false;
    std::optional<Assets::SkinChromaMap> chromas;
    source.fetch(Assets::SubjectRef{"Annie", 1}, [&](std::optional<Assets::SkinChromaMap> c) {
        called = true;
        chromas = std::move(c);
    });
    PumpUntil([&] { return called; });

    ASSERT_TRUE(called);
    EXPECT_FALSE(chromas.has_value());
    EXPECT_EQ(client_.InFlight(), 0u);
}

TEST_F(HttpAssetProberTest, CancelledRequestNeverCallsBack) {
    bool called = false;
    HttpRequestId id = client_.Get(kRefusedUrl, [&](const HttpResponse&) { called = true; });
    ASSERT_NE(id, 0u);
    client_.Cancel(id);
    EXPECT_EQ(client_.InFlight(), 0u);

    for (int i = 0; i < 10; ++i) {
        EventLoop::Get().Process();
    }
    EXPECT_FALSE(called);
}
