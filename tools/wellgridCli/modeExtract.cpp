#include "modes.hpp"

#include "imaging/pipeline/cliArgs.hpp"
#include "imaging/pipeline/pipeline.hpp"

#include <iostream>

namespace wellgrid::cli {

int runExtract(const std::vector<std::string>& args) {
	try {
		const auto job    = imaging::pipeline::parseExtractionJob(args);
		const auto report = imaging::pipeline::runExtraction(job);

		std::cout << "Stack:  " << report.stackPath.string() << "\n"
		          << "Table:  " << report.tablePath.string() << "\n";
		if (!report.summaryPath.empty()) {
			std::cout << "Mosaic: " << report.summaryPath.string() << "\n";
		}
		return ExitOk;
	} catch (const std::exception& e) {
		return reportFailure(e);
	}
}

} // namespace wellgrid::cli
