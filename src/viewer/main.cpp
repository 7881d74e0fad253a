#include "common/event/event_loop.h"
#include "common/util/strings.h"
#include "viewer/viewer_config.h"
#include "common/logging.h"
#include "viewer/graphics/model_viewer.h"

#include <csignal>
#include <iostream>
#include <vector>

#ifndef _WIN32
// Signal handlers for log level adjustment (Unix)
void HandleSigUsr1(int /*sig*/) {
	LogLevelIncrease();
}

void HandleSigUsr2(int /*sig*/) {
	LogLevelDecrease();
}
#endif

int main(int argc, char *argv[])
{
	std::string config_file = "config/champview.json";
	std::vector<CVW::Assets::SubjectRef> champions;
	CVW::Graphics::ViewerOptions options;
	uint32_t first_skin = 0;

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--config" || arg == "-c") {
			if (i + 1 < argc) {
				config_file = argv[++i];
			}
		} else if (arg == "--champion") {
			if (i + 1 < argc) {
				std::vector<std::string> parts = Strings::Split(argv[++i], ':');
				if (parts.size() != 2 || parts[0].empty() || Strings::ToUnsignedInt(parts[1]) == 0) {
					std::cerr << "--champion expects ID:KEY (for example Annie:1), got '" << argv[i] << "'\n";
					return 1;
				}
				champions.push_back(CVW::Assets::SubjectRef{parts[0], Strings::ToUnsignedInt(parts[1])});
			}
		} else if (arg == "--skin") {
			if (i + 1 < argc) {
				first_skin = Strings::ToUnsignedInt(argv[++i]);
			}
		} else if (arg == "--width") {
			if (i + 1 < argc) {
				options.width = Strings::ToInt(argv[++i]);
			}
		} else if (arg == "--height") {
			if (i + 1 < argc) {
				options.height = Strings::ToInt(argv[++i]);
			}
		} else if (arg == "--software") {
			options.softwareRenderer = true;
		} else if (arg == "--help" || arg == "-h") {
			std::cout << "Usage: " << argv[0] << " --champion ID:KEY [--champion ID:KEY ...] [options]\n";
			std::cout << "Options:\n";
			std::cout << "  -c, --config <file>      Config file (default: config/champview.json)\n";
			std::cout << "  --champion <ID:KEY>      Champion to show; repeat to browse several\n";
			std::cout << "  --skin <N>               Skin number to start on (default: 0)\n";
			std::cout << "  --width <px>             Window width (default: 1280)\n";
			std::cout << "  --height <px>            Window height (default: 720)\n";
			std::cout << "  --software               Use the software renderer\n";
			std::cout << "  --log-level=LEVEL        Set log level (NONE, FATAL, ERROR, WARN, INFO, DEBUG, TRACE)\n";
			std::cout << "  --log-module=MOD:LEVEL   Set per-module log level (e.g., MODEL:DEBUG)\n";
			std::cout << "  -h, --help               Show this help message\n";
			std::cout << "\nKeys: Left/Right skin, PgUp/PgDn champion, C chroma, X clear chroma,\n";
			std::cout << "      F alternate form, V model version, I idle clip, R re-center splash, Esc quit\n";
			return 0;
		}
	}

	InitLogging(argc, argv);

#ifndef _WIN32
	signal(SIGUSR1, HandleSigUsr1);
	signal(SIGUSR2, HandleSigUsr2);
#endif

	if (champions.empty()) {
		LOG_ERROR(MOD_MAIN, "At least one --champion ID:KEY is required");
		return 1;
	}

	CVW::ViewerConfig config;
	if (!config.load(config_file)) {
		LOG_WARN(MOD_MAIN, "Continuing with default settings");
	}
	config.applyLogging();
	// Command line wins over the config file
	InitLogging(argc, argv);

	CVW::Graphics::ModelViewer viewer(config, champions);
	if (!viewer.init(options)) {
		LOG_FATAL(MOD_MAIN, "Failed to initialize the viewer");
		return 1;
	}
	if (first_skin > 0) {
		viewer.showSkin(first_skin);
	}

	viewer.run();
	return 0;
}
