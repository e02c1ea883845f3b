#include "bibit/BinaryMatrix.h"

#include <boost/lexical_cast.hpp>

namespace bibit {

BinaryMatrix BinaryMatrix::FromStrings( const std::vector<std::string>& rows )
{
    cells_type cells( rows.size(), rows.empty() ? 0 : rows.front().size(), 0 );
    for ( size_t i = 0; i < rows.size(); i++ ) {
        const std::string& row = rows[ i ];
        if ( row.size() != cells.size2() ) {
            THROW_INVALID_INPUT( "Row #" << ( i + 1 ) << " has " << row.size()
                                 << " columns, " << cells.size2() << " expected" );
        }
        for ( size_t j = 0; j < row.size(); j++ ) {
            switch ( row[ j ] ) {
            case '0': cells( i, j ) = 0; break;
            case '1': cells( i, j ) = 1; break;
            default:
                THROW_INVALID_INPUT( "Non-binary value '" << row[ j ] << "' at row #" << ( i + 1 )
                                     << ", column #" << ( j + 1 ) );
            }
        }
    }
    return ( BinaryMatrix( cells ) );
}

void BinaryMatrix::setRowLabels( const row_labels_t& labels )
{
    if ( !labels.empty() && labels.size() != rowsCount() ) {
        THROW_INVALID_INPUT( labels.size() << " row labels given for " << rowsCount() << " rows" );
    }
    _rowLabels = labels;
}

void BinaryMatrix::setColLabels( const col_labels_t& labels )
{
    if ( !labels.empty() && labels.size() != colsCount() ) {
        THROW_INVALID_INPUT( labels.size() << " column labels given for " << colsCount() << " columns" );
    }
    _colLabels = labels;
}

row_label_t BinaryMatrix::rowLabel( row_index_t rowIx ) const
{
    return ( _rowLabels.empty() ? boost::lexical_cast<row_label_t>( rowIx + 1 )
                                : _rowLabels.at( rowIx ) );
}

col_label_t BinaryMatrix::colLabel( col_index_t colIx ) const
{
    return ( _colLabels.empty() ? boost::lexical_cast<col_label_t>( colIx + 1 )
                                : _colLabels.at( colIx ) );
}

void BinaryMatrix::checkBinary() const
{
    for ( row_index_t i = 0; i < rowsCount(); i++ ) {
        const binary_value_t* pRow = row( i );
        for ( col_index_t j = 0; j < colsCount(); j++ ) {
            if ( pRow[ j ] > 1 ) {
                THROW_INVALID_INPUT( "Non-binary value " << (int)pRow[ j ]
                                     << " at row #" << ( i + 1 ) << ", column #" << ( j + 1 ) );
            }
        }
    }
}

size_t BinaryMatrix::rowOnes( row_index_t rowIx ) const
{
    size_t res = 0;
    const binary_value_t* pRow = row( rowIx );
    for ( col_index_t j = 0; j < colsCount(); j++ ) {
        if ( pRow[ j ] ) res++;
    }
    return ( res );
}

pattern_t BinaryMatrix::rowPattern( row_index_t rowIx ) const
{
    pattern_t res( colsCount() );
    const binary_value_t* pRow = row( rowIx );
    for ( col_index_t j = 0; j < colsCount(); j++ ) {
        if ( pRow[ j ] ) res.set( j );
    }
    return ( res );
}

}
