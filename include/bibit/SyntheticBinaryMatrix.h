#pragma once

#include "BasicTypedefs.h"

#include <gsl/gsl_rng.h>

#include "BinaryMatrix.h"
#include "Bicluster.h"

namespace bibit {

/**
 *  Parameters of the random binary matrix generation.
 */
struct SyntheticMatrixParams {
    size_t          rowsCount;
    size_t          colsCount;
    double          density;            /** probability of 1 outside of the planted biclusters */
    size_t          biclustersCount;    /** number of planted biclusters */
    size_t          biclusterRows;      /** rows of each planted bicluster */
    size_t          biclusterCols;      /** columns of each planted bicluster */
    unsigned long   seed;

    SyntheticMatrixParams()
    : rowsCount( 0 ), colsCount( 0 )
    , density( 0.1 )
    , biclustersCount( 3 ), biclusterRows( 5 ), biclusterCols( 5 )
    , seed( 1981 )
    {}

    bool enabled() const {
        return ( rowsCount > 0 && colsCount > 0 );
    }

    /// throws std::invalid_argument if parameters are invalid
    void check() const;
};

/**
 *  Generates the random binary matrix with the planted biclusters.
 *
 *  Background cells are 1 with params.density probability,
 *  then all cells of each planted bicluster are set to 1.
 *  Row and column subsets of the biclusters are random and may overlap.
 *
 *  @param pPlanted optional output for the planted biclusters (without patterns)
 */
BinaryMatrix SyntheticBinaryMatrix(
    const gsl_rng*                  rng,
    const SyntheticMatrixParams&    params,
    biclusters_t*                   pPlanted = NULL
);

/**
 *  Random binary matrix with the given density and no planted biclusters.
 */
BinaryMatrix RandomBinaryMatrix(
    const gsl_rng*  rng,
    size_t          rowsCount,
    size_t          colsCount,
    double          density
);

}
