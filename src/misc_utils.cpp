#include "bibit/misc_utils.h"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

namespace bibit {

/**
 *  Test if string ends with given substring.
 */
bool endsWith(
    const char*     str,
    const char*     ending
){
    std::string oStr( str );
    std::string oEnd( ending );

    return ( oStr.length() > oEnd.length()
             && 0 == oStr.compare( oStr.length() - oEnd.length(), oEnd.length(), oEnd ) );
}

namespace {

size_t parse_positive( const std::string& str, const std::string& context )
{
    const std::string trimmed = boost::trim_copy( str );
    long value = 0;
    try {
        value = boost::lexical_cast<long>( trimmed );
    } catch ( const boost::bad_lexical_cast& ) {
        THROW_INVALID_INPUT( "Malformed value '" << trimmed << "' in '" << context << "'" );
    }
    if ( value <= 0 ) {
        THROW_INVALID_INPUT( "Non-positive value " << value << " in '" << context << "'" );
    }
    return ( (size_t)value );
}

}

std::vector<size_t> parseIndexRange( const std::string& str )
{
    std::vector<std::string> items;
    boost::split( items, str, boost::is_any_of( "," ) );

    std::vector<size_t> res;
    for ( size_t i = 0; i < items.size(); i++ ) {
        const std::string::size_type sepPos = items[ i ].find( ':' );
        if ( sepPos == std::string::npos ) {
            res.push_back( parse_positive( items[ i ], str ) );
        } else {
            const size_t first = parse_positive( items[ i ].substr( 0, sepPos ), str );
            const size_t last = parse_positive( items[ i ].substr( sepPos + 1 ), str );
            if ( last < first ) {
                THROW_INVALID_INPUT( "Empty range '" << items[ i ] << "' in '" << str << "'" );
            }
            for ( size_t v = first; v <= last; v++ ) {
                res.push_back( v );
            }
        }
    }
    return ( res );
}

}
