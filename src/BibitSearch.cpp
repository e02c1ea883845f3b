#include "bibit/BibitSearch.h"

#include <exception>

#include <boost/unordered_set.hpp>

#include "bibit/dynamic_bitset_utils.h"

namespace bibit {

namespace {

/**
 *  Candidate bicluster seeded by a pair of rows.
 */
struct SearchCandidate {
    row_index_t rowA;
    row_index_t rowB;
    bitwords_t  pattern;
    row_set_t   rows;
    bool        grown;

    SearchCandidate( row_index_t rowA, row_index_t rowB, const bitwords_t& pattern )
    : rowA( rowA ), rowB( rowB ), pattern( pattern ), grown( false )
    {}
};

size_t count_ones( const bitwords_t& words )
{
    size_t res = 0;
    for ( size_t k = 0; k < words.size(); k++ ) {
        for ( bitword_t w = words[ k ]; w; w &= w - 1 ) {
            res++;
        }
    }
    return ( res );
}

/**
 *  Adds all the rows containing the candidate's pattern.
 */
void grow_candidate(
    const EncodedMatrix&    matrix,
    SearchCandidate&        cand
){
    cand.rows.insert( cand.rowA );
    cand.rows.insert( cand.rowB );
    for ( row_index_t q = 0; q < matrix.rowsCount(); q++ ) {
        if ( q == cand.rowA || q == cand.rowB ) continue;
        if ( matrix.contains( q, cand.pattern ) ) {
            cand.rows.insert( cand.rows.end(), q );
        }
    }
    cand.grown = true;
}

}

void SearchParams::check() const
{
    if ( minRows < 1 ) {
        THROW_INVALID_INPUT( "Minimal number of bicluster rows should be positive" );
    }
    if ( minCols < 1 ) {
        THROW_INVALID_INPUT( "Minimal number of bicluster columns should be positive" );
    }
    if ( threads < 1 ) {
        THROW_INVALID_INPUT( "Number of search threads should be positive" );
    }
}

bool SearchCancellation::requested() const
{
    if ( _pStopFlag && _pStopFlag->load() ) return ( true );
    if ( _timeLimit > 0 ) {
        const seconds_t elapsed = _timer.elapsed().wall * 1E-9;
        if ( elapsed > _timeLimit ) return ( true );
    }
    return ( false );
}

biclusters_t BibitSearch(
    const EncodedMatrix&        matrix,
    const SearchParams&         params,
    SearchStatistics*           pStats,
    const SearchCancellation*   pCancellation
){
    params.check();

    SearchStatistics stats;
    const size_t nRows = matrix.rowsCount();

    // the seen patterns are local to the call, so concurrent searches are independent
    typedef boost::unordered_set<bitwords_t> pattern_set_type;
    pattern_set_type seenPatterns;
    std::vector<SearchCandidate> candidates;
    biclusters_t res;

    bitwords_t rho;
    for ( row_index_t m = 0; m < nRows && !stats.cancelled; m++ ) {
        // pattern derivation and deduplication, strictly in pairs order
        candidates.clear();
        for ( row_index_t n = m + 1; n < nRows; n++ ) {
            if ( pCancellation && pCancellation->requested() ) {
                stats.cancelled = true;
                break;
            }
            stats.pairs++;
            matrix.intersect( m, n, rho );
            if ( count_ones( rho ) < params.minCols ) {
                stats.sparsePatterns++;
                continue;
            }
            if ( !seenPatterns.insert( rho ).second ) {
                stats.duplicatePatterns++;
                continue;
            }
            candidates.push_back( SearchCandidate( m, n, rho ) );
        }

        // growing is independent for each candidate, the pattern is fixed
        std::exception_ptr growError;
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic, 1) num_threads(params.threads) if(params.threads > 1)
#endif
        for ( size_t c = 0; c < candidates.size(); c++ ) {
            // exceptions must not leave the parallel region
            try {
                if ( !pCancellation || !pCancellation->requested() ) {
                    grow_candidate( matrix, candidates[ c ] );
                }
            }
            catch ( ... ) {
#ifdef _OPENMP
#pragma omp critical(bibit_grow_error)
#endif
                if ( !growError ) growError = std::current_exception();
            }
        }
        if ( growError ) std::rethrow_exception( growError );

        for ( size_t c = 0; c < candidates.size(); c++ ) {
            const SearchCandidate& cand = candidates[ c ];
            if ( !cand.grown ) {
                // keep the results a prefix of the complete search
                stats.cancelled = true;
                break;
            }
            stats.candidates++;
            if ( cand.rows.size() < params.minRows ) {
                stats.discarded++;
                continue;
            }
            res.push_back( Bicluster( cand.rows,
                                      bitset_indices<col_set_t>( matrix.decode( cand.pattern ) ),
                                      cand.pattern ) );
        }
    }
    LOG_DEBUG2( "BiBit: " << seenPatterns.size() << " unique patterns of "
                << stats.pairs << " row pairs, " << res.size() << " biclusters" );
    LOG_DEBUG1_IF( stats.cancelled, "BiBit search cancelled after " << stats.pairs << " row pairs" );

    if ( pStats ) *pStats = stats;
    return ( res );
}

}
