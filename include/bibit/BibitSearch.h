#pragma once

#include "BasicTypedefs.h"

#include <atomic>

#include <boost/serialization/nvp.hpp>
#include <boost/timer/timer.hpp>

#include "EncodedMatrix.h"
#include "Bicluster.h"

namespace bibit {

/**
 *  Parameters of BibitSearch().
 */
struct SearchParams {
    size_t  minRows;    /** min number of rows of reported bicluster (mnr) */
    size_t  minCols;    /** min number of columns of reported bicluster (mnc) */
    size_t  threads;    /** number of threads to grow candidate biclusters */

    SearchParams( size_t minRows = 2, size_t minCols = 2, size_t threads = 1 )
    : minRows( minRows ), minCols( minCols ), threads( threads )
    {}

    /// throws std::invalid_argument if parameters are invalid
    void check() const;
};

/**
 *  Counters of BibitSearch() steps.
 */
struct SearchStatistics {
    size_t  pairs;              /** row pairs evaluated */
    size_t  sparsePatterns;     /** patterns with less than minCols columns */
    size_t  duplicatePatterns;  /** patterns already produced by the earlier pairs */
    size_t  candidates;         /** candidates grown */
    size_t  discarded;          /** candidates with less than minRows rows */
    bool    cancelled;          /** search was interrupted */

    SearchStatistics()
    : pairs( 0 ), sparsePatterns( 0 ), duplicatePatterns( 0 )
    , candidates( 0 ), discarded( 0 ), cancelled( false )
    {}

    template<class Archive>
    void serialize(Archive & ar, const unsigned int version)
    {
        ar & BOOST_SERIALIZATION_NVP( pairs );
        ar & BOOST_SERIALIZATION_NVP( sparsePatterns );
        ar & BOOST_SERIALIZATION_NVP( duplicatePatterns );
        ar & BOOST_SERIALIZATION_NVP( candidates );
        ar & BOOST_SERIALIZATION_NVP( discarded );
        ar & BOOST_SERIALIZATION_NVP( cancelled );
    }
};

/**
 *  Cooperative cancellation of the search.
 *
 *  The search is cancelled once the external stop flag is raised,
 *  or when the time limit (if positive) since the token creation is exceeded.
 */
class SearchCancellation {
private:
    const std::atomic<bool>*    _pStopFlag;
    seconds_t                   _timeLimit;
    boost::timer::cpu_timer     _timer;

public:
    SearchCancellation( const std::atomic<bool>* pStopFlag = NULL, seconds_t timeLimit = 0 )
    : _pStopFlag( pStopFlag ), _timeLimit( timeLimit )
    {}

    virtual ~SearchCancellation()
    {}

    /**
     *  Polled by the search before each row pair and before growing each candidate,
     *  possibly from several threads.
     */
    virtual bool requested() const;

    seconds_t timeLimit() const {
        return ( _timeLimit );
    }
};

/**
 *  Exhaustive pairwise search of biclusters (BiBit algorithm).
 *
 *  Row pairs (m, n), m < n, are visited in row-major order.
 *  The pair's AND of bitwords defines the candidate pattern,
 *  that is dropped if it has less than minCols columns,
 *  or if an earlier pair already produced the same pattern.
 *  Only the new dense patterns are grown: every other row
 *  containing the pattern joins the candidate,
 *  and the candidate is reported if it has at least minRows rows.
 *
 *  The output order follows the order of the originating pairs and
 *  does not depend on params.threads.
 *
 *  @param pStats optional counters of the search steps
 *  @param pCancellation optional cancellation token, checked once per pair
 *         and once per grown candidate
 */
biclusters_t BibitSearch(
    const EncodedMatrix&        matrix,
    const SearchParams&         params,
    SearchStatistics*           pStats = NULL,
    const SearchCancellation*   pCancellation = NULL
);

}
