#include "bibit/BasicTypedefs.h"

#include <boost/format.hpp>

#include <gsl/gsl_rng.h>

#include "bibit/ConsoleSweepExecutionMonitor.h"
#include "bibit/SweepResultsSerialize.h"

#include "ParametersReader.h"

using namespace bibit;

namespace {

BinaryMatrix LoadOrSimulateMatrix(
    const SyntheticMatrixParams&    simulationParams,
    const BibitIOParams&            ioParams
){
    if ( simulationParams.enabled() ) {
        LOG_INFO( "Simulating " << simulationParams.rowsCount << "x" << simulationParams.colsCount
                  << " binary matrix (seed=" << simulationParams.seed << ")..." );
        gsl_rng* rng = gsl_rng_alloc( gsl_rng_default );
        gsl_rng_set( rng, simulationParams.seed );
        try {
            BinaryMatrix res = SyntheticBinaryMatrix( rng, simulationParams );
            gsl_rng_free( rng );
            return ( res );
        } catch ( ... ) {
            gsl_rng_free( rng );
            throw;
        }
    }
    return ( BinaryMatrixImportCSV( ioParams ) );
}

}

int main( int argc, char* argv[] )
{
    SweepParams             sweepParams;
    SyntheticMatrixParams   simulationParams;
    BibitIOParams           ioParams;
    BibitDriverParams       driverParams;

    try {
        if ( !BibitParamsRead( argc, argv,
                               sweepParams, simulationParams,
                               ioParams, driverParams ) )
        {
            // --help option was given, no computation
            return ( 0 );
        }

        BinaryMatrix matrix = LoadOrSimulateMatrix( simulationParams, ioParams );
        LOG_INFO( "Binary matrix: " << matrix.rowsCount() << " rows, " << matrix.colsCount() << " columns" );

        if ( sweepParams.bitwordWidths.empty() ) {
            sweepParams.bitwordWidths = SweepParams::Defaults( matrix.colsCount() ).bitwordWidths;
        }

        if ( driverParams.estimateOnly ) {
            sweepParams.check();
            const SweepCostEstimate cost = EstimateSweepCost( matrix, sweepParams );
            std::cout << boost::format( "rows=%d cols=%d pairs_per_run=%d runs=%d word_operations=%.3g\n" )
                         % cost.rowsCount % cost.colsCount % cost.pairsCount
                         % cost.runsCount % cost.wordOperations;
            return ( 0 );
        }

        StdOutSweepExecutionMonitor mon( driverParams.verbosity );

        LOG_INFO( "Running BiBit parameters sweep..." );
        SweepResults res = ParameterSweep_run( matrix, sweepParams,
                                               driverParams.verbosity > 0 ? &mon : NULL );
        LOG_INFO( "Sweep finished: " << res.runsCount( RunCompleted ) << " completed, "
                  << res.runsCount( RunCancelled ) << " cancelled, "
                  << res.runsCount( RunFailed ) << " failed run(s)" );

        if ( !ioParams.outputFilename.empty() ) {
            LOG_INFO( "Saving sweep results to file " << ioParams.outputFilename << "..." );
            SweepResultsSave( ioParams.outputFilename.c_str(), res );
            LOG_INFO( "Saving done" );
        } else {
            LOG_INFO( "Results were not saved: no output filename specified" );
        }
        if ( !ioParams.statsFilename.empty() ) {
            RunStatisticsSaveTSV( ioParams.statsFilename.c_str(), res );
        } else {
            RunStatisticsWriteTSV( std::cout, res );
        }
        return ( res.runsCount( RunFailed ) > 0 ? 2 : 0 );
    }
    catch ( const std::exception& e ) {
        LOG_STDERR( "ERROR: " << e.what() );
        return ( 1 );
    }
}
