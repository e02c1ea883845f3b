#pragma once

#include "BasicTypedefs.h"

#include <boost/serialization/nvp.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include "array2d.h"

namespace bibit {

/**
 *  Presence/absence matrix: rows are samples, columns are features.
 *
 *  Cells are expected to be 0 or 1, checkBinary() verifies that.
 *  Labels are optional, if given, their number should match
 *  the corresponding dimension.
 */
class BinaryMatrix {
public:
    typedef array2d<binary_value_t> cells_type;

private:
    cells_type      _cells;
    row_labels_t    _rowLabels;
    col_labels_t    _colLabels;

    friend class boost::serialization::access;

    template<class Archive>
    void serialize(Archive & ar, const unsigned int version)
    {
        ar & boost::serialization::make_nvp( "cells", _cells );
        ar & boost::serialization::make_nvp( "rowLabels", _rowLabels );
        ar & boost::serialization::make_nvp( "colLabels", _colLabels );
    }

public:
    BinaryMatrix( size_t rowsCount = 0, size_t colsCount = 0 )
    : _cells( rowsCount, colsCount, 0 )
    {}

    explicit BinaryMatrix( const cells_type& cells )
    : _cells( cells )
    {}

    /**
     *  Builds the matrix from the strings of '0' and '1' characters,
     *  one string per row.
     */
    static BinaryMatrix FromStrings( const std::vector<std::string>& rows );

    size_t rowsCount() const {
        return ( _cells.size1() );
    }
    size_t colsCount() const {
        return ( _cells.size2() );
    }
    bool empty() const {
        return ( _cells.empty() );
    }

    binary_value_t operator()( row_index_t rowIx, col_index_t colIx ) const {
        return ( _cells( rowIx, colIx ) );
    }
    binary_value_t& operator()( row_index_t rowIx, col_index_t colIx ) {
        return ( _cells( rowIx, colIx ) );
    }
    const binary_value_t* row( row_index_t rowIx ) const {
        return ( _cells.row( rowIx ) );
    }
    const cells_type& cells() const {
        return ( _cells );
    }

    const row_labels_t& rowLabels() const {
        return ( _rowLabels );
    }
    const col_labels_t& colLabels() const {
        return ( _colLabels );
    }
    void setRowLabels( const row_labels_t& labels );
    void setColLabels( const col_labels_t& labels );

    /// label of the row, or its 1-based number if no labels defined
    row_label_t rowLabel( row_index_t rowIx ) const;
    col_label_t colLabel( col_index_t colIx ) const;

    /**
     *  Throws std::invalid_argument pointing to
     *  the first cell that is neither 0 nor 1.
     */
    void checkBinary() const;

    /// number of 1s in the row
    size_t rowOnes( row_index_t rowIx ) const;

    /// columns with 1 in the given row
    pattern_t rowPattern( row_index_t rowIx ) const;

    bool operator==( const BinaryMatrix& that ) const {
        return ( _cells == that._cells
              && _rowLabels == that._rowLabels
              && _colLabels == that._colLabels );
    }
};

}
