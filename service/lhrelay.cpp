#include "../node/Metrics.hpp"
#include "../relay/RelayConfig.hpp"
#include "RelayCommand.hpp"

#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

using namespace LinkHelper;

int main(int argc, char** argv)
{
	std::string configPath;
	std::vector<std::string> args;
	for (int i = 1; i < argc; ++i) {
		if ((! strcmp(argv[i], "-h")) || (! strcmp(argv[i], "--help"))) {
			printRelayHelp(argv[0], stdout);
			return LH_EXIT_OK;
		}
		else if (! strcmp(argv[i], "-c")) {
			if ((i + 1) >= argc) {
				printRelayHelp(argv[0], stderr);
				return LH_EXIT_BAD_INPUT;
			}
			configPath = argv[++i];
		}
		else {
			args.push_back(argv[i]);
		}
	}
	if (args.empty()) {
		printRelayHelp(argv[0], stderr);
		return LH_EXIT_BAD_INPUT;
	}

	RelayConfig rc;
	try {
		rc = loadRelayConfig(configPath);
	}
	catch (const std::runtime_error& e) {
		fprintf(stderr, "%s: FATAL: %s\n", argv[0], e.what());
		return LH_EXIT_BAD_INPUT;
	}

	if (! rc.metricsFile.empty()) {
		if (! Metrics::saveToFile(rc.metricsFile)) {
			fprintf(stderr, "%s: WARNING: unable to write metrics to %s\n", argv[0], rc.metricsFile.c_str());
		}
	}

	return runRelayCommand(args, rc, stdout, stderr);
}
