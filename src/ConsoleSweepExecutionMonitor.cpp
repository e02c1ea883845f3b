#include "bibit/ConsoleSweepExecutionMonitor.h"

#include <cstdio>

#include <boost/format.hpp>

namespace bibit {

ConsoleSweepExecutionMonitor::ConsoleSweepExecutionMonitor(
    SweepExecutionMonitor::log_level_t verbosity,
    size_t reportPeriod
) : SweepExecutionMonitor( verbosity )
  , _runsCount( 0 ), _runsFinished( 0 )
  , _runsFailed( 0 ), _runsCancelled( 0 )
  , _reportPeriod( reportPeriod > 0 ? reportPeriod : 1 )
{
}

void ConsoleSweepExecutionMonitor::log( log_level_t level, const std::string& message )
{
    if ( level <= verbosity() ) {
        print( boost::str( boost::format( "[%.0f ms] %s\n" ) % ( _timer.elapsed().wall * 1E-6 ) % message ) );
    }
}

void ConsoleSweepExecutionMonitor::notifySweepStarted(
    const SweepParams& params,
    const SweepCostEstimate& cost
){
    std::lock_guard<std::mutex> lock( _mutex );
    _runsCount = cost.runsCount;
    _runsFinished = 0;
    _runsFailed = 0;
    _runsCancelled = 0;
    _timer.start();
    print( boost::str( boost::format( "BiBit sweep: %d runs on %dx%d matrix, %d row pairs per run, ~%.3g word operations\n" )
                       % cost.runsCount % cost.rowsCount % cost.colsCount
                       % cost.pairsCount % cost.wordOperations ) );
}

void ConsoleSweepExecutionMonitor::notifyRunStarted( size_t runIndex, const RunParameters& params )
{
    if ( verbosity() < 2 ) return;

    std::lock_guard<std::mutex> lock( _mutex );
    LogMessage msgOutput = logOutput( 2 );
    msgOutput << "run #" << ( runIndex + 1 ) << " started: bwl=" << params.bitwordWidth
              << " mnr=" << params.minRows << " mnc=" << params.minCols;
}

void ConsoleSweepExecutionMonitor::notifyRunFinished( const RunStatistics& stats )
{
    std::lock_guard<std::mutex> lock( _mutex );
    _runsFinished++;
    if ( stats.status == RunFailed ) _runsFailed++;
    if ( stats.status == RunCancelled ) _runsCancelled++;

    if ( verbosity() >= 1 ) {
        LogMessage msgOutput = logOutput( 1 );
        msgOutput << boost::format( "run #%d (bwl=%d mnr=%d mnc=%d) %s: %d biclusters, %d rows, %d cols, %.3f s" )
                     % ( stats.runIndex + 1 )
                     % stats.params.bitwordWidth % stats.params.minRows % stats.params.minCols
                     % RunStatusName( stats.status )
                     % stats.biclustersCount % stats.coveredRowsCount() % stats.coveredColsCount()
                     % stats.totalTime;
    }
    else if ( _runsFinished % _reportPeriod == 0 || _runsFinished == _runsCount ) {
        print( boost::str( boost::format( "%d/%d runs done (%.0f ms)...\n" )
                           % _runsFinished % _runsCount % ( _timer.elapsed().wall * 1E-6 ) ) );
    }
}

void ConsoleSweepExecutionMonitor::notifySweepFinished( const SweepResults& results )
{
    std::lock_guard<std::mutex> lock( _mutex );
    size_t biclustersCount = 0;
    for ( size_t i = 0; i < results.runs.size(); i++ ) {
        biclustersCount += results.runs[ i ].stats.biclustersCount;
    }
    print( boost::str( boost::format( "BiBit sweep finished, %d runs (%d failed, %d cancelled), %d biclusters, %.0f ms\n" )
                       % _runsFinished % _runsFailed % _runsCancelled
                       % biclustersCount % ( _timer.elapsed().wall * 1E-6 ) ) );
}

void StdOutSweepExecutionMonitor::print( const std::string& line )
{
    std::fputs( line.c_str(), stdout );
    std::fflush( stdout );
}

}
