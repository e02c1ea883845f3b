#pragma once

#include "BasicTypedefs.h"

#include <algorithm>
#include <stdexcept>
#include <vector>
#include <boost/serialization/access.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/vector.hpp>

namespace bibit {

/**
 *  Dense row-major 2D array.
 *
 *  Rows are contiguous, so row( i ) gives a pointer
 *  to size2() consecutive elements.
 */
template<typename T>
class array2d {
private:
    typedef typename std::vector<T> container_type;
    size_t          _size1;
    size_t          _size2;
    container_type  _data;

    friend class boost::serialization::access;

    template<class Archive>
    void serialize(Archive & ar, const unsigned int version)
    {
        ar & boost::serialization::make_nvp( "size1", _size1 );
        ar & boost::serialization::make_nvp( "size2", _size2 );
        ar & boost::serialization::make_nvp( "data", _data );
    }

public:
    typedef T value_type;

    array2d( size_t size1 = 0, size_t size2 = 0, const T& val = T() )
    : _size1( size1 ), _size2( size2 )
    , _data( size1 * size2, val )
    {}

    void reset( size_t size1 = 0, size_t size2 = 0, const T& val = T() )
    {
        _size1 = size1;
        _size2 = size2;
        _data.assign( _size1 * _size2, val );
    }

    bool empty() const {
        return ( _size1 == 0 || _size2 == 0 );
    }

    size_t size1() const {
        return ( _size1 );
    }
    size_t size2() const {
        return ( _size2 );
    }

    const T& operator()( size_t i, size_t j ) const {
        BOOST_ASSERT( ( i < _size1 ) && ( j < _size2 ) );
        return ( _data[ i * _size2 + j ] );
    }
    T& operator()( size_t i, size_t j ) {
        BOOST_ASSERT( ( i < _size1 ) && ( j < _size2 ) );
        return ( _data[ i * _size2 + j ] );
    }

    /**
     *  Pointer to the first element of i-th row.
     */
    const T* row( size_t i ) const {
        BOOST_ASSERT( i < _size1 );
        return ( _data.empty() ? NULL : &_data[ i * _size2 ] );
    }
    T* row( size_t i ) {
        BOOST_ASSERT( i < _size1 );
        return ( _data.empty() ? NULL : &_data[ i * _size2 ] );
    }

    void fill( const T& val )
    {
        std::fill( _data.begin(), _data.end(), val );
    }

    /**
     *  Appends a row, its length should match size2()
     *  (or define it, if the array is still empty).
     */
    template<typename Vector>
    void push_back1( const Vector& v )
    {
        if ( _size1 == 0 && _size2 == 0 ) {
            _size2 = v.size();
        }
        else if ( v.size() != _size2 ) {
            THROW_EXCEPTION( std::invalid_argument, "Row length " << v.size() << " does not match array width " << _size2 );
        }
        _data.insert( _data.end(), v.begin(), v.end() );
        _size1++;
    }

    bool operator==( const array2d<T>& that ) const {
        return ( _size1 == that._size1 && _size2 == that._size2 && _data == that._data );
    }
    bool operator!=( const array2d<T>& that ) const {
        return ( !operator==( that ) );
    }
};

}
