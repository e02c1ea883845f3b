#include "bibit/ParameterSweep.h"

#include <boost/timer/timer.hpp>

#include "bibit/EncodedMatrix.h"
#include "bibit/SweepExecutionMonitor.h"

namespace bibit {

namespace {

std::vector<size_t> index_range( size_t first, size_t last )
{
    std::vector<size_t> res;
    for ( size_t i = first; i <= last; i++ ) {
        res.push_back( i );
    }
    return ( res );
}

seconds_t wall_seconds( const boost::timer::cpu_timer& timer )
{
    return ( timer.elapsed().wall * 1E-9 );
}

void check_range( const std::vector<size_t>& range, const char* name )
{
    if ( range.empty() ) {
        THROW_INVALID_INPUT( "Empty " << name << " range" );
    }
    for ( size_t i = 0; i < range.size(); i++ ) {
        if ( range[ i ] == 0 ) {
            THROW_INVALID_INPUT( "Non-positive value in " << name << " range" );
        }
    }
}

}

const char* RunStatusName( RunStatus status )
{
    switch ( status ) {
    case RunPending: return ( "pending" );
    case RunCompleted: return ( "completed" );
    case RunCancelled: return ( "cancelled" );
    case RunFailed: return ( "failed" );
    }
    return ( "unknown" );
}

void RunStatistics::collect( const biclusters_t& biclusters )
{
    biclustersCount = biclusters.size();
    coveredRows.clear();
    coveredCols.clear();
    for ( size_t i = 0; i < biclusters.size(); i++ ) {
        coveredRows.insert( biclusters[ i ].rows.begin(), biclusters[ i ].rows.end() );
        coveredCols.insert( biclusters[ i ].cols.begin(), biclusters[ i ].cols.end() );
    }
}

SweepParams::SweepParams()
    : minRows( index_range( 2, 10 ) )
    , minCols( index_range( 2, 10 ) )
    , threads( 1 )
    , searchThreads( 1 )
    , runTimeLimit( 0 )
    , keepBiclusters( true )
{
}

SweepParams SweepParams::Defaults( size_t colsCount )
{
    SweepParams res;
    res.bitwordWidths = index_range( 2, DefaultMaxBitwordWidth( colsCount ) );
    return ( res );
}

std::vector<RunParameters> SweepParams::runParameters() const
{
    std::vector<RunParameters> res;
    res.reserve( runsCount() );
    for ( size_t i = 0; i < bitwordWidths.size(); i++ ) {
        for ( size_t j = 0; j < minRows.size(); j++ ) {
            for ( size_t k = 0; k < minCols.size(); k++ ) {
                res.push_back( RunParameters( bitwordWidths[ i ], minRows[ j ], minCols[ k ] ) );
            }
        }
    }
    return ( res );
}

void SweepParams::check() const
{
    check_range( bitwordWidths, "bitword width" );
    for ( size_t i = 0; i < bitwordWidths.size(); i++ ) {
        CheckBitwordWidth( bitwordWidths[ i ] );
    }
    check_range( minRows, "min rows" );
    check_range( minCols, "min columns" );
    if ( threads < 1 ) {
        THROW_INVALID_INPUT( "Number of sweep threads should be positive" );
    }
    if ( searchThreads < 1 ) {
        THROW_INVALID_INPUT( "Number of search threads should be positive" );
    }
    if ( runTimeLimit < 0 ) {
        THROW_INVALID_INPUT( "Negative run time limit" );
    }
}

size_t SweepResults::runsCount( RunStatus status ) const
{
    size_t res = 0;
    for ( size_t i = 0; i < runs.size(); i++ ) {
        if ( runs[ i ].stats.status == status ) res++;
    }
    return ( res );
}

SweepCostEstimate EstimateSweepCost(
    size_t              rowsCount,
    size_t              colsCount,
    const SweepParams&  params
){
    SweepCostEstimate res;
    res.rowsCount = rowsCount;
    res.colsCount = colsCount;
    res.pairsCount = rowsCount > 1 ? rowsCount * ( rowsCount - 1 ) / 2 : 0;
    res.runsCount = params.runsCount();
    const size_t thresholdsCount = params.minRows.size() * params.minCols.size();
    for ( size_t i = 0; i < params.bitwordWidths.size(); i++ ) {
        if ( params.bitwordWidths[ i ] == 0 ) continue;
        const double words = BitwordsCount( colsCount, params.bitwordWidths[ i ] );
        // AND of each pair, then growth of at most one pattern per pair
        const double runOps = res.pairsCount * words * ( 1.0 + rowsCount );
        res.wordOperations += runOps * thresholdsCount;
    }
    return ( res );
}

SweepRun BibitRun(
    const BinaryMatrix&         matrix,
    const RunParameters&        params,
    size_t                      runIndex,
    size_t                      searchThreads,
    const SearchCancellation*   pCancellation
){
    SweepRun res( RunStatistics( runIndex, params ) );
    RunStatistics& stats = res.stats;
    stats.rowsCount = matrix.rowsCount();
    stats.colsCount = matrix.colsCount();

    boost::timer::cpu_timer totalTimer;
    boost::timer::cpu_timer encodingTimer;
    EncodedMatrix encoded = BitwordEncode( matrix, params.bitwordWidth );
    stats.encodingTime = wall_seconds( encodingTimer );
    stats.wordsCount = encoded.wordsCount();

    boost::timer::cpu_timer searchTimer;
    res.biclusters = BibitSearch( encoded,
                                  SearchParams( params.minRows, params.minCols, searchThreads ),
                                  &stats.search, pCancellation );
    stats.searchTime = wall_seconds( searchTimer );
    stats.totalTime = wall_seconds( totalTimer );

    stats.collect( res.biclusters );
    stats.status = stats.search.cancelled ? RunCancelled : RunCompleted;
    return ( res );
}

SweepResults ParameterSweep_run(
    const BinaryMatrix&         matrix,
    const SweepParams&          params,
    SweepExecutionMonitor*      pMonitor,
    const std::atomic<bool>*    pStopFlag
){
    // fail fast, before any run is started
    matrix.checkBinary();
    params.check();

    const std::vector<RunParameters> runParams = params.runParameters();
    const SweepCostEstimate cost = EstimateSweepCost( matrix, params );

    SweepResults res;
    res.rowLabels = matrix.rowLabels();
    res.colLabels = matrix.colLabels();
    res.runs.resize( runParams.size() );
    for ( size_t runIx = 0; runIx < runParams.size(); runIx++ ) {
        res.runs[ runIx ].stats = RunStatistics( runIx, runParams[ runIx ] );
    }

    LOG_DEBUG1( "Starting " << runParams.size() << " BiBit runs on "
                << matrix.rowsCount() << "x" << matrix.colsCount() << " matrix using "
                << params.threads << " thread(s)" );
    if ( pMonitor ) pMonitor->notifySweepStarted( params, cost );

#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic, 1) num_threads(params.threads) if(params.threads > 1)
#endif
    for ( size_t runIx = 0; runIx < runParams.size(); runIx++ ) {
        SweepRun& run = res.runs[ runIx ];
        if ( pStopFlag && pStopFlag->load() ) {
            run.stats.status = RunCancelled;
            if ( pMonitor ) pMonitor->notifyRunFinished( run.stats );
            continue;
        }
        try {
            if ( pMonitor ) pMonitor->notifyRunStarted( runIx, runParams[ runIx ] );
            SearchCancellation cancellation( pStopFlag, params.runTimeLimit );
            run = BibitRun( matrix, runParams[ runIx ], runIx, params.searchThreads, &cancellation );
            if ( !params.keepBiclusters ) {
                biclusters_t().swap( run.biclusters );
            }
        }
        catch ( const std::exception& e ) {
            // the run is abandoned, the other runs continue
            run = SweepRun( RunStatistics( runIx, runParams[ runIx ] ) );
            run.stats.status = RunFailed;
            run.stats.error = e.what();
            LOG_WARN( "BiBit run #" << ( runIx + 1 ) << " (bwl=" << runParams[ runIx ].bitwordWidth
                      << " mnr=" << runParams[ runIx ].minRows << " mnc=" << runParams[ runIx ].minCols
                      << ") failed: " << e.what() );
        }
        if ( pMonitor ) pMonitor->notifyRunFinished( run.stats );
    }

    LOG_WARN_IF( res.runsCount( RunFailed ) > 0, res.runsCount( RunFailed ) << " BiBit run(s) failed" );
    if ( pMonitor ) pMonitor->notifySweepFinished( res );
    return ( res );
}

}
