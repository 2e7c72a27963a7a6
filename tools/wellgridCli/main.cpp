#include "modes.hpp"

#include "imaging/core/errors.hpp"

#include <opencv2/core.hpp>

#include <iostream>
#include <string>
#include <vector>

/*
  CLI entry point.

  Modes:
    - extract   : fit the well grid from four corners and cut one stamp per well.
    - threshold : threshold a stamp stack and write one image per kept well.
*/
static void print_usage() {
	std::cout << "Usage:\n"
	          << "  wellgrid-cli extract   --image=chip.tif --tl=x,y --tr=x,y --bl=x,y --br=x,y\n"
	          << "                         --subarrays=cols,rows --wells=cols,rows --spacing=v|x,y\n"
	          << "                         [--stamp=32] [--max-residual=3] [--fill=0]\n"
	          << "                         [--out=.] [--prefix=<image stem>] [--summary] [--debug=debug.png]\n"
	          << "  wellgrid-cli threshold --stack=<prefix>_stamps.tif --table=<prefix>_coordinates.csv\n"
	          << "                         [--threshold=128] [--mode=binarize|mask|passthrough] [--cutoff=0.5]\n"
	          << "                         [--gate=keep|discard] [--include-invalid] [--out=.] [--prefix=<prefix>]\n"
	          << "  Set WELLGRID_DEBUG=1 for per-well diagnostics.\n";
}

namespace wellgrid::cli {

int reportFailure(const std::exception& e) {
	namespace core = imaging::core;

	std::cerr << "[Error] " << e.what() << "\n";
	if (const auto* fit = dynamic_cast<const core::FitError*>(&e)) {
		std::cerr << "[Error] Corner residual: " << fit->residual() << " px\n";
		return ExitFit;
	}
	if (dynamic_cast<const core::ConfigError*>(&e))
		return ExitConfig;
	if (dynamic_cast<const core::ManifestError*>(&e))
		return ExitManifest;
	if (dynamic_cast<const core::IoError*>(&e) || dynamic_cast<const cv::Exception*>(&e))
		return ExitIo;
	return ExitFailure;
}

} // namespace wellgrid::cli

int main(int argc, char** argv) {
	using namespace wellgrid::cli;

	if (argc < 2) {
		print_usage();
		return ExitFailure;
	}
	const std::string mode = argv[1];
	const std::vector<std::string> args(argv + 2, argv + argc);

	if (mode == "extract")
		return runExtract(args);
	if (mode == "threshold")
		return runThreshold(args);
	if (mode == "help" || mode == "--help") {
		print_usage();
		return ExitOk;
	}

	std::cerr << "[Error] Unknown mode: " << mode << "\n";
	print_usage();
	return ExitFailure;
}
