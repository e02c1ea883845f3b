#pragma once

#include "BasicTypedefs.h"

#include <atomic>

#include <boost/serialization/nvp.hpp>
#include <boost/serialization/library_version_type.hpp>
#include <boost/serialization/set.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include "BinaryMatrix.h"
#include "BibitSearch.h"

namespace bibit {

class SweepExecutionMonitor;

/**
 *  Parameters of a single BiBit run.
 */
struct RunParameters {
    size_t  bitwordWidth;   /** bwl */
    size_t  minRows;        /** mnr */
    size_t  minCols;        /** mnc */

    RunParameters( size_t bitwordWidth = 2, size_t minRows = 2, size_t minCols = 2 )
    : bitwordWidth( bitwordWidth ), minRows( minRows ), minCols( minCols )
    {}

    bool operator==( const RunParameters& that ) const {
        return ( bitwordWidth == that.bitwordWidth
              && minRows == that.minRows && minCols == that.minCols );
    }

    template<class Archive>
    void serialize(Archive & ar, const unsigned int version)
    {
        ar & BOOST_SERIALIZATION_NVP( bitwordWidth );
        ar & BOOST_SERIALIZATION_NVP( minRows );
        ar & BOOST_SERIALIZATION_NVP( minCols );
    }
};

enum RunStatus {
    RunPending = 0,
    RunCompleted,
    RunCancelled,
    RunFailed
};

const char* RunStatusName( RunStatus status );

/**
 *  Statistics of a single BiBit run.
 */
struct RunStatistics {
    size_t          runIndex;       /** position of the run in the parameters cross product */
    RunParameters   params;
    RunStatus       status;
    std::string     error;          /** error message of the failed run */

    size_t          rowsCount;      /** rows of the input matrix */
    size_t          colsCount;      /** columns of the input matrix */
    size_t          wordsCount;     /** bitwords per encoded row */

    size_t          biclustersCount;
    row_set_t       coveredRows;    /** union of rows of all the biclusters */
    col_set_t       coveredCols;    /** union of columns of all the biclusters */

    seconds_t       encodingTime;
    seconds_t       searchTime;
    seconds_t       totalTime;

    SearchStatistics    search;

    RunStatistics( size_t runIndex = 0, const RunParameters& params = RunParameters() )
    : runIndex( runIndex ), params( params ), status( RunPending )
    , rowsCount( 0 ), colsCount( 0 ), wordsCount( 0 )
    , biclustersCount( 0 )
    , encodingTime( 0 ), searchTime( 0 ), totalTime( 0 )
    {}

    size_t coveredRowsCount() const {
        return ( coveredRows.size() );
    }
    size_t coveredColsCount() const {
        return ( coveredCols.size() );
    }

    /**
     *  Updates the counts and the coverage.
     */
    void collect( const biclusters_t& biclusters );

    template<class Archive>
    void serialize(Archive & ar, const unsigned int version)
    {
        ar & BOOST_SERIALIZATION_NVP( runIndex );
        ar & BOOST_SERIALIZATION_NVP( params );
        ar & BOOST_SERIALIZATION_NVP( status );
        ar & BOOST_SERIALIZATION_NVP( error );
        ar & BOOST_SERIALIZATION_NVP( rowsCount );
        ar & BOOST_SERIALIZATION_NVP( colsCount );
        ar & BOOST_SERIALIZATION_NVP( wordsCount );
        ar & BOOST_SERIALIZATION_NVP( biclustersCount );
        ar & BOOST_SERIALIZATION_NVP( coveredRows );
        ar & BOOST_SERIALIZATION_NVP( coveredCols );
        ar & BOOST_SERIALIZATION_NVP( encodingTime );
        ar & BOOST_SERIALIZATION_NVP( searchTime );
        ar & BOOST_SERIALIZATION_NVP( totalTime );
        ar & BOOST_SERIALIZATION_NVP( search );
    }
};

/**
 *  Statistics and biclusters of one run of the sweep.
 */
struct SweepRun {
    RunStatistics   stats;
    biclusters_t    biclusters;

    SweepRun( const RunStatistics& stats = RunStatistics() )
    : stats( stats )
    {}

    template<class Archive>
    void serialize(Archive & ar, const unsigned int version)
    {
        ar & BOOST_SERIALIZATION_NVP( stats );
        ar & BOOST_SERIALIZATION_NVP( biclusters );
    }
};

/**
 *  Parameters of ParameterSweep_run().
 *  The ranges are the ordered lists of values.
 */
struct SweepParams {
    std::vector<size_t> bitwordWidths;  /** bwl range */
    std::vector<size_t> minRows;        /** mnr range */
    std::vector<size_t> minCols;        /** mnc range */
    size_t      threads;                /** number of runs executed in parallel */
    size_t      searchThreads;          /** threads used by a single run */
    seconds_t   runTimeLimit;           /** max duration of a run, 0 = unlimited */
    bool        keepBiclusters;         /** store biclusters in the results, or just statistics */

    SweepParams();

    /**
     *  Default ranges for matrix with given number of columns:
     *  bwl from 2 to ceil(log2(colsCount)), mnr and mnc from 2 to 10.
     */
    static SweepParams Defaults( size_t colsCount );

    /// number of runs in parameters cross product
    size_t runsCount() const {
        return ( bitwordWidths.size() * minRows.size() * minCols.size() );
    }

    /**
     *  Parameters of the runs in bwl, mnr, mnc order
     *  (mnc changes the fastest).
     */
    std::vector<RunParameters> runParameters() const;

    /// throws std::invalid_argument if parameters are invalid
    void check() const;
};

/**
 *  Upper bound of the sweep computational cost.
 */
struct SweepCostEstimate {
    size_t  rowsCount;
    size_t  colsCount;
    size_t  pairsCount;         /** row pairs per run */
    size_t  runsCount;
    double  wordOperations;     /** bitword operations over all the runs, upper bound */

    SweepCostEstimate()
    : rowsCount( 0 ), colsCount( 0 ), pairsCount( 0 ), runsCount( 0 ), wordOperations( 0 )
    {}
};

SweepCostEstimate EstimateSweepCost( size_t rowsCount, size_t colsCount, const SweepParams& params );

inline SweepCostEstimate EstimateSweepCost( const BinaryMatrix& matrix, const SweepParams& params )
{
    return ( EstimateSweepCost( matrix.rowsCount(), matrix.colsCount(), params ) );
}

/**
 *  Results of the parameters sweep.
 *  Runs are in the order of SweepParams::runParameters().
 */
struct SweepResults {
    row_labels_t            rowLabels;
    col_labels_t            colLabels;
    std::vector<SweepRun>   runs;

    size_t runsCount( RunStatus status ) const;

    template<class Archive>
    void serialize(Archive & ar, const unsigned int version)
    {
        ar & BOOST_SERIALIZATION_NVP( rowLabels );
        ar & BOOST_SERIALIZATION_NVP( colLabels );
        ar & BOOST_SERIALIZATION_NVP( runs );
    }
};

/**
 *  Encodes the matrix and searches the biclusters for the given run parameters.
 *
 *  Exceptions of encoding or search are not caught.
 */
SweepRun BibitRun(
    const BinaryMatrix&         matrix,
    const RunParameters&        params,
    size_t                      runIndex = 0,
    size_t                      searchThreads = 1,
    const SearchCancellation*   pCancellation = NULL
);

/**
 *  Runs BiBit for all the combinations of the sweep parameters.
 *
 *  The input is validated before any run starts (std::invalid_argument).
 *  Runs are distributed between params.threads workers,
 *  a run that throws is marked as failed and does not affect the other runs.
 *
 *  @param pMonitor optional progress monitor
 *  @param pStopFlag optional flag to cancel the runs in progress and skip the rest
 */
SweepResults ParameterSweep_run(
    const BinaryMatrix&         matrix,
    const SweepParams&          params,
    SweepExecutionMonitor*      pMonitor = NULL,
    const std::atomic<bool>*    pStopFlag = NULL
);

}
