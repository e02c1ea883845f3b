#pragma once

#include "BasicTypedefs.h"

#include <boost/dynamic_bitset.hpp>

#define foreach_bit( iterator_type, iterator_name, bitset ) \
    for ( iterator_type iterator_name = (bitset).find_first(); iterator_name != boost::dynamic_bitset<>::npos; iterator_name = (bitset).find_next( iterator_name ) )

namespace bibit {

/**
 *  Indices of the set bits.
 */
template<class IndexSet>
IndexSet bitset_indices( const boost::dynamic_bitset<>& bitset )
{
    IndexSet res;
    foreach_bit( size_t, ix, bitset ) {
        res.insert( res.end(), ix );
    }
    return ( res );
}

/**
 *  Pattern as a string of 0/1 characters, column 0 first.
 *  Note that boost::to_string() puts the highest bit first.
 */
inline std::string pattern_string( const pattern_t& pattern )
{
    std::string res( pattern.size(), '0' );
    foreach_bit( size_t, colIx, pattern ) {
        res[ colIx ] = '1';
    }
    return ( res );
}

}
