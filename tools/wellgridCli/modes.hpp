#pragma once

#include <exception>
#include <string>
#include <vector>

namespace wellgrid::cli {

/* Entry points of the CLI subcommands.
   Each function gets the options after the subcommand and returns the process exit code. */

//! Exit codes. One per error class so scripts can react without parsing messages.
enum ExitCode : int {
	ExitOk       = 0, //!< Success.
	ExitFailure  = 1, //!< Usage error or unexpected failure.
	ExitConfig   = 2,
	ExitFit      = 3,
	ExitIo       = 4,
	ExitManifest = 5,
};

/* Stage 1: crop one stamp per well.
   Example:
     wellgrid-cli extract --image=chip.tif --tl=12,10 --tr=980,14 --bl=8,1002 --br=976,1006
                          --subarrays=4,4 --wells=10,10 --spacing=20 --stamp=24 --out=run1 --summary */
int runExtract(const std::vector<std::string>& args);

/* Stage 2: threshold the stamps of stage 1.
   Example:
     wellgrid-cli threshold --stack=run1/chip_stamps.tif --table=run1/chip_coordinates.csv --threshold=1200 --mode=mask --gate=discard */
int runThreshold(const std::vector<std::string>& args);

//! Map an exception of the pipeline to its exit code and print it as "[Error] ...".
int reportFailure(const std::exception& e);

} // namespace wellgrid::cli
