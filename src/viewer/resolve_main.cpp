#include "common/event/event_loop.h"
#include "common/net/http_client.h"
#include "common/util/strings.h"
#include "viewer/viewer_config.h"
#include "common/logging.h"
#include "viewer/assets/candidate_generator.h"
#include "viewer/assets/chroma_list.h"
#include "viewer/assets/directory_lister.h"
#include "viewer/assets/fallback_image_loader.h"
#include "viewer/assets/http_asset_prober.h"
#include "viewer/assets/http_image_source.h"
#include "viewer/assets/probe_resolver.h"
#include "viewer/assets/snapshot_json.h"
#include "viewer/assets/variant_orchestrator.h"

#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>

#ifndef _WIN32
static void HandleSigUsr1(int) { LogLevelIncrease(); }
static void HandleSigUsr2(int) { LogLevelDecrease(); }
#endif

namespace {

// Pump the loop until done() holds or nothing is left to wait for
void RunUntil(const std::function<bool()> &done)
{
	while (!done()) {
		if (!CVW::EventLoop::Get().RunOnce()) {
			break;
		}
	}
}

} // namespace

int main(int argc, char *argv[])
{
	std::string config_file = "config/champview.json";
	std::string champion;
	uint32_t skin_number = 0;
	std::optional<uint32_t> chroma_id;
	bool alternate_form = false;
	uint32_t version_index = 0;
	bool resolve_art = true;

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--config" || arg == "-c") {
			if (i + 1 < argc) {
				config_file = argv[++i];
			}
		} else if (arg == "--champion") {
			if (i + 1 < argc) {
				champion = argv[++i];
			}
		} else if (arg == "--skin") {
			if (i + 1 < argc) {
				skin_number = Strings::ToUnsignedInt(argv[++i]);
			}
		} else if (arg == "--chroma") {
			if (i + 1 < argc) {
				chroma_id = Strings::ToUnsignedInt(argv[++i]);
			}
		} else if (arg == "--form") {
			alternate_form = true;
		} else if (arg == "--version") {
			if (i + 1 < argc) {
				version_index = Strings::ToUnsignedInt(argv[++i]);
			}
		} else if (arg == "--no-art") {
			resolve_art = false;
		} else if (arg == "--help" || arg == "-h") {
			std::cout << "Usage: " << argv[0] << " --champion ID:KEY [options]\n";
			std::cout << "Options:\n";
			std::cout << "  -c, --config <file>      Config file (default: config/champview.json)\n";
			std::cout << "  --champion <ID:KEY>      Champion id and numeric key, e.g. Annie:1\n";
			std::cout << "  --skin <N>               Skin number (default: 0)\n";
			std::cout << "  --chroma <ID>            Chroma id, e.g. 1012\n";
			std::cout << "  --form                   Show the alternate form\n";
			std::cout << "  --version <N>            Historical model version (0 = current)\n";
			std::cout << "  --no-art                 Skip splash and loading art\n";
			std::cout << "  --log-level=LEVEL        Set log level (NONE, FATAL, ERROR, WARN, INFO, DEBUG, TRACE)\n";
			std::cout << "  --log-module=MOD:LEVEL   Set per-module log level (e.g., PROBE:TRACE)\n";
			std::cout << "                           Modules: NET, HTTP, PROBE, RESOLVE, ART, MODEL,\n";
			std::cout << "                                    VARIANT, GRAPHICS, INPUT, CONFIG, MAIN\n";
			std::cout << "  -h, --help               Show this help message\n";
			return 0;
		}
	}

	InitLogging(argc, argv);

#ifndef _WIN32
	signal(SIGUSR1, HandleSigUsr1);
	signal(SIGUSR2, HandleSigUsr2);
#endif

	std::vector<std::string> parts = Strings::Split(champion, ':');
	if (parts.size() != 2 || parts[0].empty() || Strings::ToUnsignedInt(parts[1]) == 0) {
		LOG_ERROR(MOD_MAIN, "--champion expects ID:KEY (for example Annie:1), got '{}'", champion);
		return 1;
	}
	CVW::Assets::SubjectRef subject{parts[0], Strings::ToUnsignedInt(parts[1])};

	CVW::ViewerConfig config;
	if (!config.load(config_file)) {
		LOG_WARN(MOD_MAIN, "Continuing with default settings");
	}
	config.applyLogging();
	// Command line wins over the config file
	InitLogging(argc, argv);

	CVW::HttpClient http;
	if (!http.IsReady()) {
		LOG_ERROR(MOD_MAIN, "HTTP client unavailable");
		return 1;
	}
	http.SetTimeoutMs(config.probe().timeoutMs);

	CVW::Assets::AssetUrls urls(config.hosts(), config.urlTemplates());
	CVW::Assets::CandidateGenerator generator(config.catalog(), urls);
	CVW::Assets::HttpAssetProber prober(http, config.probe().cacheResults);
	CVW::Assets::HttpDirectoryLister lister(http);
	CVW::Assets::ProbeResolver resolver(prober, &lister);
	CVW::Assets::HttpChromaListSource chroma_lists(http, urls);
	CVW::Assets::VariantOrchestrator orchestrator(generator, resolver, &chroma_lists);

	LOG_INFO(MOD_MAIN, "Resolving {} (key {}) skin {}", subject.id, subject.key, skin_number);

	orchestrator.selectSkin(subject, skin_number);
	if (chroma_id) {
		orchestrator.selectChroma(chroma_id);
	}
	RunUntil([&] { return orchestrator.isSettled(); });

	if (alternate_form) {
		orchestrator.setAlternateForm(true);
		RunUntil([&] { return orchestrator.isSettled(); });
	}
	if (version_index > 0) {
		orchestrator.setVersionIndex(version_index);
	}

	Json::Value output = CVW::Assets::snapshotToJson(orchestrator.snapshot());

	if (resolve_art) {
		CVW::Assets::HttpImageSource images(http);
		CVW::Assets::SelectionContext ctx;
		ctx.subject = subject;
		ctx.skinId = CVW::Assets::makeSkinId(subject.key, skin_number);

		struct ArtSlot {
			const char *name;
			CVW::Assets::AssetFamily family;
		};
		const ArtSlot slots[] = {
			{"splashUrl", CVW::Assets::AssetFamily::SplashArt},
			{"loadingUrl", CVW::Assets::AssetFamily::LoadingArt},
		};
		for (const auto &slot : slots) {
			CVW::Assets::FallbackImageLoader loader(images, config.art().loadTimeoutMs);
			loader.setUrls(generator.generate(ctx, slot.family).urls());
			RunUntil([&] { return loader.isDone(); });

			const auto &loaded = loader.loadedUrl();
			output[slot.name] = loaded ? Json::Value(*loaded) : Json::Value(Json::nullValue);
			if (loaded) {
				images.forget(*loaded);
			}
		}
	}

	Json::StreamWriterBuilder writer;
	writer["indentation"] = "  ";
	std::cout << Json::writeString(writer, output) << std::endl;
	return 0;
}
