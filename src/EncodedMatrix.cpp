#include "bibit/EncodedMatrix.h"

namespace bibit {

size_t CheckBitwordWidth( size_t bitwordWidth )
{
    if ( bitwordWidth < 2 ) {
        THROW_INVALID_INPUT( "Bitword width should be at least 2, " << bitwordWidth << " given" );
    }
    if ( bitwordWidth > BITWORD_MAX_WIDTH ) {
        THROW_INVALID_INPUT( "Bitword width should not exceed " << BITWORD_MAX_WIDTH
                             << ", " << bitwordWidth << " given" );
    }
    return ( bitwordWidth );
}

size_t DefaultMaxBitwordWidth( size_t colsCount )
{
    size_t res = 0;
    while ( res < BITWORD_MAX_WIDTH && ( (bitword_t)1 << res ) < colsCount ) {
        res++;
    }
    return ( res < 2 ? 2 : res );
}

EncodedMatrix::EncodedMatrix(
    const BinaryMatrix& matrix,
    size_t              bitwordWidth
) : _bitwordWidth( CheckBitwordWidth( bitwordWidth ) )
  , _colsCount( matrix.colsCount() )
  , _words( matrix.rowsCount(), BitwordsCount( matrix.colsCount(), _bitwordWidth ), 0 )
{
    const size_t nWords = wordsCount();
    _validBits.resize( nWords, _bitwordWidth );
    _wordMasks.resize( nWords );
    if ( nWords > 0 ) {
        _validBits.back() = _colsCount - ( nWords - 1 ) * _bitwordWidth;
    }
    for ( size_t k = 0; k < nWords; k++ ) {
        _wordMasks[ k ] = _validBits[ k ] == BITWORD_MAX_WIDTH
                        ? ~(bitword_t)0
                        : ( ( (bitword_t)1 << _validBits[ k ] ) - 1 );
    }

    for ( row_index_t i = 0; i < matrix.rowsCount(); i++ ) {
        const binary_value_t* pCells = matrix.row( i );
        bitword_t* pWords = _words.row( i );
        for ( size_t k = 0; k < nWords; k++ ) {
            const binary_value_t* pGroup = pCells + k * _bitwordWidth;
            bitword_t word = 0;
            for ( size_t b = 0; b < _validBits[ k ]; b++ ) {
                BOOST_ASSERT( pGroup[ b ] <= 1 );
                word = ( word << 1 ) | ( pGroup[ b ] ? 1 : 0 );
            }
            pWords[ k ] = word;
        }
    }
    LOG_DEBUG2( "Encoded " << rowsCount() << "x" << colsCount() << " matrix into "
                << nWords << " bitwords per row (bwl=" << _bitwordWidth << ")" );
}

void EncodedMatrix::intersect(
    row_index_t rowA,
    row_index_t rowB,
    bitwords_t& res
) const {
    const bitword_t* pA = row( rowA );
    const bitword_t* pB = row( rowB );
    res.resize( wordsCount() );
    for ( size_t k = 0; k < res.size(); k++ ) {
        res[ k ] = pA[ k ] & pB[ k ] & _wordMasks[ k ];
    }
}

bool EncodedMatrix::contains(
    row_index_t         rowIx,
    const bitwords_t&   pattern
) const {
    BOOST_ASSERT( pattern.size() == wordsCount() );
    const bitword_t* pRow = row( rowIx );
    for ( size_t k = 0; k < pattern.size(); k++ ) {
        const bitword_t patWord = pattern[ k ] & _wordMasks[ k ];
        if ( ( patWord & pRow[ k ] ) != patWord ) return ( false );
    }
    return ( true );
}

pattern_t EncodedMatrix::decode( const bitword_t* words ) const
{
    pattern_t res( _colsCount );
    for ( size_t k = 0; k < wordsCount(); k++ ) {
        const size_t nBits = _validBits[ k ];
        const bitword_t word = words[ k ];
        const col_index_t firstCol = k * _bitwordWidth;
        for ( size_t b = 0; b < nBits; b++ ) {
            if ( ( word >> ( nBits - 1 - b ) ) & 1 ) {
                res.set( firstCol + b );
            }
        }
    }
    return ( res );
}

}
