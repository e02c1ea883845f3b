#pragma once

#include <iostream>
#include <stdexcept>
#include <sstream>

#include <mutex>

#if defined(NDEBUG)
#define BOOST_DISABLE_ASSERTS
#else
#define _DEBUG
#endif

#define BOOST_ENABLE_ASSERT_HANDLER

#include <boost/assert.hpp>

namespace boost
{

/**
 *  Invariant violations abort the current computation (e.g. one sweep run)
 *  rather than the whole process.
 */
inline void assertion_failed(char const * expr, char const * function, char const * file, long line)
{
    std::ostringstream out;
    out << file << "(" << line << "): assertion failed in " << function << ": " << expr;
    throw std::runtime_error( out.str() );
}

inline void assertion_failed_msg(char const * expr, char const * msg, char const * function, char const * file, long line)
{
    std::ostringstream out;
    out << file << "(" << line << "): assertion failed in " << function << ": " << expr << " (" << msg << ")";
    throw std::runtime_error( out.str() );
}

}

namespace bibit {

/**
 *  Lock serializing writes of log lines,
 *  sweep workers log concurrently.
 */
inline std::mutex& log_mutex()
{
    static std::mutex mtx;
    return ( mtx );
}

}

#define LOG_STDERR( msg ) { std::ostringstream __log__msg__; __log__msg__ << msg << '\n'; \
    std::lock_guard<std::mutex> __log__lock__( bibit::log_mutex() ); std::cerr << __log__msg__.str(); }

#define LOG_INFO( msg ) LOG_STDERR( msg )
#define LOG_INFO_IF( condition, msg ) if ( condition ) { LOG_STDERR( msg ); }

#define LOG_WARN( msg ) LOG_STDERR( "WARNING: " << msg )
#define LOG_WARN_IF( condition, msg ) if ( condition ) { LOG_WARN( msg ); }

#if DEBUG_LEVEL >= 0
#define LOG_DEBUG0( msg ) LOG_STDERR( msg )
#define LOG_DEBUG0_IF( condition, msg ) if ( condition ) { LOG_STDERR( msg ); }
#else
#define LOG_DEBUG0( msg )
#define LOG_DEBUG0_IF( condition, msg )
#endif

#if DEBUG_LEVEL >= 1
#define LOG_DEBUG1( msg ) LOG_STDERR( msg )
#define LOG_DEBUG1_IF( condition, msg ) if ( condition ) { LOG_STDERR( msg ); }
#else
#define LOG_DEBUG1( msg )
#define LOG_DEBUG1_IF( condition, msg )
#endif

#if DEBUG_LEVEL >= 2
#define LOG_DEBUG2( msg ) LOG_STDERR( msg )
#define LOG_DEBUG2_IF( condition, msg ) if ( condition ) { LOG_STDERR( msg ); }
#else
#define LOG_DEBUG2( msg )
#define LOG_DEBUG2_IF( condition, msg )
#endif

#if DEBUG_LEVEL >= 3
#define LOG_DEBUG3( msg ) LOG_STDERR( msg )
#define LOG_DEBUG3_IF( condition, msg ) if ( condition ) { LOG_STDERR( msg ); }
#else
#define LOG_DEBUG3( msg )
#define LOG_DEBUG3_IF( condition, msg )
#endif

#define THROW_EXCEPTION( excp_class, msg ) { std::ostringstream __excp__msg__; __excp__msg__ << msg; throw excp_class( __excp__msg__.str() ); }
#define THROW_RUNTIME_ERROR( msg ) THROW_EXCEPTION( std::runtime_error, msg )
#define THROW_INVALID_INPUT( msg ) THROW_EXCEPTION( std::invalid_argument, msg )
