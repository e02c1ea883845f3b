#pragma once

#include "BasicTypedefs.h"

#include "array2d.h"
#include "BinaryMatrix.h"

namespace bibit {

/**
 *  Binary matrix with each row packed into bitwords.
 *
 *  Each bitword holds up to bitwordWidth() consecutive columns,
 *  the lowest column index goes to the most significant of the word's valid bits.
 *  The last word of a row holds the remaining columns only, its value
 *  is not left-padded, so validBits( k ) tells how many
 *  low-order bits of k-th word are meaningful.
 *
 *  @see BitwordEncode()
 */
class EncodedMatrix {
public:
    typedef array2d<bitword_t> words_type;

private:
    size_t              _bitwordWidth;
    size_t              _colsCount;
    words_type          _words;
    std::vector<size_t> _validBits;     /** number of meaningful bits of each word */
    bitwords_t          _wordMasks;     /** masks of meaningful bits of each word */

public:
    EncodedMatrix( const BinaryMatrix& matrix, size_t bitwordWidth );

    size_t rowsCount() const {
        return ( _words.size1() );
    }
    /// number of columns of the original matrix
    size_t colsCount() const {
        return ( _colsCount );
    }
    size_t bitwordWidth() const {
        return ( _bitwordWidth );
    }
    /// number of bitwords per row
    size_t wordsCount() const {
        return ( _words.size2() );
    }
    size_t validBits( size_t wordIx ) const {
        return ( _validBits[ wordIx ] );
    }
    bitword_t wordMask( size_t wordIx ) const {
        return ( _wordMasks[ wordIx ] );
    }
    const bitword_t* row( row_index_t rowIx ) const {
        return ( _words.row( rowIx ) );
    }
    bitword_t word( row_index_t rowIx, size_t wordIx ) const {
        return ( _words( rowIx, wordIx ) );
    }

    /**
     *  Word-by-word AND of two rows, padding bits cleared.
     */
    void intersect( row_index_t rowA, row_index_t rowB, bitwords_t& res ) const;

    /**
     *  Checks that the row has all the bits of the pattern set,
     *  i.e. ( pattern AND row ) == pattern, ignoring padding bits.
     */
    bool contains( row_index_t rowIx, const bitwords_t& pattern ) const;

    /**
     *  Decodes wordsCount() bitwords into the pattern of colsCount() bits.
     */
    pattern_t decode( const bitword_t* words ) const;
    pattern_t decode( const bitwords_t& words ) const {
        BOOST_ASSERT( words.size() == wordsCount() );
        return ( decode( words.empty() ? NULL : &words[0] ) );
    }
    pattern_t decodeRow( row_index_t rowIx ) const {
        return ( decode( row( rowIx ) ) );
    }
};

/**
 *  Number of bitwords per row of width bitwordWidth
 *  to encode colsCount columns.
 */
inline size_t BitwordsCount( size_t colsCount, size_t bitwordWidth )
{
    return ( ( colsCount + bitwordWidth - 1 ) / bitwordWidth );
}

/**
 *  ceil(log2(colsCount)), but not less than 2,
 *  the upper limit of the default bitword widths range.
 */
size_t DefaultMaxBitwordWidth( size_t colsCount );

/**
 *  Checks that the bitword width is supported,
 *  throws std::invalid_argument otherwise.
 *
 *  @return bitwordWidth
 */
size_t CheckBitwordWidth( size_t bitwordWidth );

/**
 *  Encodes the rows of the binary matrix into bitwords of given width.
 */
inline EncodedMatrix BitwordEncode( const BinaryMatrix& matrix, size_t bitwordWidth )
{
    return ( EncodedMatrix( matrix, bitwordWidth ) );
}

}
