#pragma once

#include "BasicTypedefs.h"

namespace bibit {

bool endsWith( const char* str, const char* ending );

/**
 *  Parses the list of positive integers.
 *  Accepts comma-separated values and inclusive ranges
 *  ("first:last"), e.g. "2:5,8,10".
 *
 *  Throws std::invalid_argument for malformed or non-positive values.
 */
std::vector<size_t> parseIndexRange( const std::string& str );

}
