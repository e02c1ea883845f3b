#pragma once

#include "BasicTypedefs.h"

#include <boost/serialization/nvp.hpp>
#include <boost/serialization/library_version_type.hpp>
#include <boost/serialization/set.hpp>
#include <boost/serialization/vector.hpp>

namespace bibit {

/**
 *  Submatrix of the binary matrix, such that
 *  all its rows have 1s in all its columns.
 */
struct Bicluster {
    row_set_t   rows;       /** rows of the bicluster */
    col_set_t   cols;       /** columns shared by all the rows */
    bitwords_t  pattern;    /** bitwords of the shared pattern */

    Bicluster()
    {}

    Bicluster( const row_set_t& rows, const col_set_t& cols, const bitwords_t& pattern )
    : rows( rows ), cols( cols ), pattern( pattern )
    {}

    size_t rowsCount() const {
        return ( rows.size() );
    }
    size_t colsCount() const {
        return ( cols.size() );
    }

    bool operator==( const Bicluster& that ) const {
        return ( rows == that.rows && cols == that.cols && pattern == that.pattern );
    }
    bool operator!=( const Bicluster& that ) const {
        return ( !operator==( that ) );
    }

    template<class Archive>
    void serialize(Archive & ar, const unsigned int version)
    {
        ar & BOOST_SERIALIZATION_NVP( rows );
        ar & BOOST_SERIALIZATION_NVP( cols );
        ar & BOOST_SERIALIZATION_NVP( pattern );
    }
};

typedef std::vector<Bicluster> biclusters_t;

}
