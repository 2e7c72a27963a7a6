#include "modes.hpp"

#include "imaging/pipeline/cliArgs.hpp"
#include "imaging/pipeline/pipeline.hpp"

#include <iostream>

namespace wellgrid::cli {

int runThreshold(const std::vector<std::string>& args) {
	try {
		const auto job    = imaging::pipeline::parseThresholdJob(args);
		const auto report = imaging::pipeline::runThresholding(job);

		std::cout << "Images: " << report.imagesWritten << "\n"
		          << "Table:  " << report.tablePath.string() << "\n";
		return ExitOk;
	} catch (const std::exception& e) {
		return reportFailure(e);
	}
}

} // namespace wellgrid::cli
