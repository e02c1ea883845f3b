#pragma once

#include "bibit/BasicTypedefs.h"
#include <string>

#include "bibit/ParameterSweep.h"
#include "bibit/BinaryMatrixImportCSV.h"
#include "bibit/SyntheticBinaryMatrix.h"

namespace bibit {

/**
 *  Options of bibit-sweep not covered by the other parameter structs.
 */
struct BibitDriverParams {
    int     verbosity;
    bool    estimateOnly;   /** print the sweep cost estimate and exit */

    BibitDriverParams()
    : verbosity( 1 ), estimateOnly( false )
    {}
};

/**
 *  Reads bibit-sweep parameters from the command line
 *  and the optional configuration file.
 *
 *  sweepParams.bitwordWidths is left empty if --bwl is not given.
 *
 *  @return false if --help was requested
 */
bool BibitParamsRead(
    int argc, char* argv[],
    SweepParams&            sweepParams,
    SyntheticMatrixParams&  simulationParams,
    BibitIOParams&          ioParams,
    BibitDriverParams&      driverParams
);

}
