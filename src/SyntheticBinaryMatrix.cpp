#include "bibit/SyntheticBinaryMatrix.h"

#include <gsl/gsl_randist.h>

namespace bibit {

namespace {

template<class IndexSet>
IndexSet random_subset( const gsl_rng* rng, size_t total, size_t size )
{
    std::vector<size_t> all( total );
    for ( size_t i = 0; i < total; i++ ) {
        all[ i ] = i;
    }
    std::vector<size_t> chosen( size );
    gsl_ran_choose( rng, chosen.data(), size, all.data(), total, sizeof( size_t ) );
    return ( IndexSet( chosen.begin(), chosen.end() ) );
}

}

void SyntheticMatrixParams::check() const
{
    if ( density < 0.0 || density > 1.0 ) {
        THROW_INVALID_INPUT( "Matrix density should be within [0, 1], " << density << " given" );
    }
    if ( biclustersCount > 0 ) {
        if ( biclusterRows == 0 || biclusterRows > rowsCount ) {
            THROW_INVALID_INPUT( "Planted bicluster rows (" << biclusterRows
                                 << ") should be within 1.." << rowsCount );
        }
        if ( biclusterCols == 0 || biclusterCols > colsCount ) {
            THROW_INVALID_INPUT( "Planted bicluster columns (" << biclusterCols
                                 << ") should be within 1.." << colsCount );
        }
    }
}

BinaryMatrix RandomBinaryMatrix(
    const gsl_rng*  rng,
    size_t          rowsCount,
    size_t          colsCount,
    double          density
){
    BinaryMatrix res( rowsCount, colsCount );
    for ( row_index_t rowIx = 0; rowIx < rowsCount; rowIx++ ) {
        for ( col_index_t colIx = 0; colIx < colsCount; colIx++ ) {
            res( rowIx, colIx ) = gsl_ran_bernoulli( rng, density ) ? 1 : 0;
        }
    }
    return ( res );
}

BinaryMatrix SyntheticBinaryMatrix(
    const gsl_rng*                  rng,
    const SyntheticMatrixParams&    params,
    biclusters_t*                   pPlanted
){
    params.check();
    LOG_DEBUG1( "Generating " << params.rowsCount << "x" << params.colsCount
                << " binary matrix with " << params.biclustersCount << " planted biclusters" );

    BinaryMatrix res = RandomBinaryMatrix( rng, params.rowsCount, params.colsCount, params.density );
    if ( pPlanted ) pPlanted->clear();
    for ( size_t i = 0; i < params.biclustersCount; i++ ) {
        Bicluster bicluster;
        bicluster.rows = random_subset<row_set_t>( rng, params.rowsCount, params.biclusterRows );
        bicluster.cols = random_subset<col_set_t>( rng, params.colsCount, params.biclusterCols );
        for ( row_set_t::const_iterator rit = bicluster.rows.begin(); rit != bicluster.rows.end(); ++rit ) {
            for ( col_set_t::const_iterator cit = bicluster.cols.begin(); cit != bicluster.cols.end(); ++cit ) {
                res( *rit, *cit ) = 1;
            }
        }
        if ( pPlanted ) pPlanted->push_back( bicluster );
    }
    return ( res );
}

}
