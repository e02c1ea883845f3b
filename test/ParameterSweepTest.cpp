#include <gtest/gtest.h>

#include "bibit/ParameterSweep.h"
#include "bibit/ConsoleSweepExecutionMonitor.h"
#include "bibit/SyntheticBinaryMatrix.h"

#include "TestCommon.h"

using namespace bibit;

namespace {

SweepParams SmallSweepParams()
{
    SweepParams params;
    params.bitwordWidths.clear();
    params.bitwordWidths.push_back( 2 );
    params.bitwordWidths.push_back( 4 );
    params.minRows.clear();
    params.minRows.push_back( 2 );
    params.minRows.push_back( 4 );
    params.minCols.clear();
    params.minCols.push_back( 2 );
    params.minCols.push_back( 5 );
    return ( params );
}

/**
 *  Collects the printed lines.
 */
class RecordingSweepExecutionMonitor: public ConsoleSweepExecutionMonitor {
protected:
    virtual void print( const std::string& line )
    {
        lines.push_back( line );
    }

public:
    std::vector<std::string> lines;

    RecordingSweepExecutionMonitor( log_level_t verbosity )
    : ConsoleSweepExecutionMonitor( verbosity, 1 )
    {}
};

}

TEST( ParameterSweep, default_params )
{
    const SweepParams params = SweepParams::Defaults( 100 );
    ASSERT_EQ( 6, params.bitwordWidths.size() );
    EXPECT_EQ( 2, params.bitwordWidths.front() );
    EXPECT_EQ( 7, params.bitwordWidths.back() );
    EXPECT_EQ( 9, params.minRows.size() );
    EXPECT_EQ( 10, params.minCols.back() );
    EXPECT_EQ( 6 * 9 * 9, params.runsCount() );
    EXPECT_NO_THROW( params.check() );

    // no bitword widths by default
    EXPECT_THROW( SweepParams().check(), std::invalid_argument );
}

TEST( ParameterSweep, runs_order )
{
    const SweepParams params = SmallSweepParams();
    const std::vector<RunParameters> runs = params.runParameters();
    ASSERT_EQ( 8, runs.size() );
    EXPECT_EQ( RunParameters( 2, 2, 2 ), runs[0] );
    EXPECT_EQ( RunParameters( 2, 2, 5 ), runs[1] );
    EXPECT_EQ( RunParameters( 2, 4, 2 ), runs[2] );
    EXPECT_EQ( RunParameters( 4, 2, 2 ), runs[4] );
    EXPECT_EQ( RunParameters( 4, 4, 5 ), runs[7] );
}

TEST( ParameterSweep, small_matrix )
{
    const BinaryMatrix matrix = SmallTestMatrix();
    const SweepResults res = ParameterSweep_run( matrix, SmallSweepParams() );

    ASSERT_EQ( 8, res.runs.size() );
    EXPECT_EQ( 8, res.runsCount( RunCompleted ) );
    for ( size_t runIx = 0; runIx < res.runs.size(); runIx++ ) {
        const RunStatistics& stats = res.runs[ runIx ].stats;
        EXPECT_EQ( runIx, stats.runIndex );
        EXPECT_EQ( 4, stats.rowsCount );
        EXPECT_EQ( 4, stats.colsCount );
        EXPECT_EQ( 6, stats.search.pairs );
        EXPECT_EQ( res.runs[ runIx ].biclusters.size(), stats.biclustersCount );

        const bool expectBicluster = stats.params.minRows <= 3 && stats.params.minCols <= 2;
        if ( expectBicluster ) {
            EXPECT_EQ( 1, stats.biclustersCount );
            EXPECT_EQ( 3, stats.coveredRowsCount() );
            EXPECT_EQ( 2, stats.coveredColsCount() );
        } else {
            // runs without biclusters still have statistics
            EXPECT_EQ( 0, stats.biclustersCount );
            EXPECT_EQ( 0, stats.coveredRowsCount() );
            EXPECT_GE( stats.totalTime, 0.0 );
        }
    }
    EXPECT_EQ( 2, res.runs[0].stats.wordsCount );
    EXPECT_EQ( 1, res.runs[4].stats.wordsCount );
}

TEST( ParameterSweep, invalid_input )
{
    SweepParams params = SmallSweepParams();

    BinaryMatrix nonBinary = SmallTestMatrix();
    nonBinary( 1, 2 ) = 2;
    EXPECT_THROW( ParameterSweep_run( nonBinary, params ), std::invalid_argument );

    params.bitwordWidths.push_back( 1 );
    EXPECT_THROW( ParameterSweep_run( SmallTestMatrix(), params ), std::invalid_argument );

    params = SmallSweepParams();
    params.minCols.clear();
    EXPECT_THROW( ParameterSweep_run( SmallTestMatrix(), params ), std::invalid_argument );

    params = SmallSweepParams();
    params.minRows.push_back( 0 );
    EXPECT_THROW( ParameterSweep_run( SmallTestMatrix(), params ), std::invalid_argument );

    params = SmallSweepParams();
    params.threads = 0;
    EXPECT_THROW( ParameterSweep_run( SmallTestMatrix(), params ), std::invalid_argument );
}

TEST( ParameterSweep, cost_estimate )
{
    const SweepCostEstimate cost = EstimateSweepCost( 10, 9, SmallSweepParams() );
    EXPECT_EQ( 10, cost.rowsCount );
    EXPECT_EQ( 9, cost.colsCount );
    EXPECT_EQ( 45, cost.pairsCount );
    EXPECT_EQ( 8, cost.runsCount );
    // bwl=2: 5 words, bwl=4: 3 words, 4 threshold combinations each
    EXPECT_DOUBLE_EQ( 45.0 * ( 5 + 3 ) * 11 * 4, cost.wordOperations );

    EXPECT_EQ( 0, EstimateSweepCost( 1, 9, SmallSweepParams() ).pairsCount );
}

TEST( ParameterSweep, keep_only_statistics )
{
    SweepParams params = SmallSweepParams();
    params.keepBiclusters = false;
    const SweepResults res = ParameterSweep_run( SmallTestMatrix(), params );
    EXPECT_TRUE( res.runs[0].biclusters.empty() );
    EXPECT_EQ( 1, res.runs[0].stats.biclustersCount );
}

TEST_F2( GslRngTestF, ParameterSweep, threaded_equals_sequential )
{
    const BinaryMatrix matrix = RandomBinaryMatrix( rndGen, 25, 30, 0.35 );
    SweepParams params = SweepParams::Defaults( matrix.colsCount() );
    params.minRows.resize( 3 );
    params.minCols.resize( 3 );

    const SweepResults seqRes = ParameterSweep_run( matrix, params );
    params.threads = 4;
    params.searchThreads = 2;
    const SweepResults parRes = ParameterSweep_run( matrix, params );

    ASSERT_EQ( seqRes.runs.size(), parRes.runs.size() );
    for ( size_t runIx = 0; runIx < seqRes.runs.size(); runIx++ ) {
        EXPECT_EQ( seqRes.runs[ runIx ].stats.params, parRes.runs[ runIx ].stats.params );
        EXPECT_EQ( seqRes.runs[ runIx ].biclusters, parRes.runs[ runIx ].biclusters );
        EXPECT_EQ( RunCompleted, parRes.runs[ runIx ].stats.status );
    }
}

TEST( ParameterSweep, stop_flag_cancels_runs )
{
    std::atomic<bool> stopFlag( true );
    const SweepResults res = ParameterSweep_run( SmallTestMatrix(), SmallSweepParams(), NULL, &stopFlag );
    ASSERT_EQ( 8, res.runs.size() );
    EXPECT_EQ( 8, res.runsCount( RunCancelled ) );
    EXPECT_TRUE( res.runs[0].biclusters.empty() );
}

TEST( ParameterSweep, run_failure_is_reported )
{
    EXPECT_THROW( BibitRun( SmallTestMatrix(), RunParameters( 1, 2, 2 ) ), std::invalid_argument );
    EXPECT_STREQ( "failed", RunStatusName( RunFailed ) );
    EXPECT_STREQ( "completed", RunStatusName( RunCompleted ) );
}

TEST( ParameterSweep, monitor_notifications )
{
    RecordingSweepExecutionMonitor mon( 2 );
    const SweepResults res = ParameterSweep_run( SmallTestMatrix(), SmallSweepParams(), &mon );
    EXPECT_EQ( 8, mon.runsFinished() );
    ASSERT_FALSE( mon.lines.empty() );
    EXPECT_NE( std::string::npos, mon.lines.front().find( "8 runs" ) );
}

TEST( ParameterSweep, run_time_limit_cancels_runs )
{
    SweepParams params = SmallSweepParams();
    params.runTimeLimit = 1E-9;
    const SweepResults res = ParameterSweep_run( SmallTestMatrix(), params );
    ASSERT_EQ( 8, res.runs.size() );
    for ( size_t runIx = 0; runIx < res.runs.size(); runIx++ ) {
        const RunStatistics& stats = res.runs[ runIx ].stats;
        EXPECT_EQ( RunCancelled, stats.status ) << "run #" << runIx;
        EXPECT_TRUE( stats.search.cancelled );
        // encoding is done before the search is cancelled
        EXPECT_GT( stats.wordsCount, 0 );
    }

    params.runTimeLimit = -1;
    EXPECT_THROW( ParameterSweep_run( SmallTestMatrix(), params ), std::invalid_argument );
}

namespace {

/**
 *  Fails to start the given run.
 */
class FailingSweepExecutionMonitor: public RecordingSweepExecutionMonitor {
private:
    size_t  _failedRunIndex;

public:
    FailingSweepExecutionMonitor( size_t failedRunIndex )
    : RecordingSweepExecutionMonitor( 0 ), _failedRunIndex( failedRunIndex )
    {}

    virtual void notifyRunStarted( size_t runIndex, const RunParameters& params )
    {
        if ( runIndex == _failedRunIndex ) {
            THROW_RUNTIME_ERROR( "run #" << runIndex << " rejected" );
        }
        RecordingSweepExecutionMonitor::notifyRunStarted( runIndex, params );
    }
};

}

TEST( ParameterSweep, failed_run_does_not_stop_sweep )
{
    for ( size_t threads = 1; threads <= 3; threads += 2 ) {
        SweepParams params = SmallSweepParams();
        params.threads = threads;
        FailingSweepExecutionMonitor mon( 2 );
        const SweepResults res = ParameterSweep_run( SmallTestMatrix(), params, &mon );

        ASSERT_EQ( 8, res.runs.size() );
        EXPECT_EQ( 1, res.runsCount( RunFailed ) );
        EXPECT_EQ( 7, res.runsCount( RunCompleted ) );
        const RunStatistics& failed = res.runs[2].stats;
        EXPECT_EQ( RunFailed, failed.status );
        EXPECT_EQ( 2, failed.runIndex );
        EXPECT_EQ( RunParameters( 2, 4, 2 ), failed.params );
        EXPECT_EQ( "run #2 rejected", failed.error );
        EXPECT_TRUE( res.runs[2].biclusters.empty() );
        EXPECT_EQ( 1, res.runs[0].stats.biclustersCount );
        EXPECT_EQ( 8, mon.runsFinished() );
    }
}
