#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include <boost/cstdint.hpp>
#include <boost/dynamic_bitset.hpp>

#include <limits>

#if defined(NDEBUG)
#define DEBUG_LEVEL -1
#else
#define DEBUG_LEVEL 1
#endif

#include "debug.h"

namespace bibit {

/// index of matrix row (sample)
typedef std::size_t row_index_t;

/// index of matrix column (feature)
typedef std::size_t col_index_t;

/// value of binary matrix cell
typedef unsigned char binary_value_t;

/// encoded group of consecutive matrix columns
typedef boost::uint64_t bitword_t;

/// maximal number of columns packed into one bitword
#define BITWORD_MAX_WIDTH ( (std::size_t)std::numeric_limits<bibit::bitword_t>::digits )

typedef std::set<row_index_t> row_set_t;
typedef std::set<col_index_t> col_set_t;

/// decoded pattern: bit j is set iff column j is shared
typedef boost::dynamic_bitset<> pattern_t;

typedef std::vector<bitword_t> bitwords_t;

typedef std::string row_label_t;
typedef std::string col_label_t;

typedef std::vector<row_label_t> row_labels_t;
typedef std::vector<col_label_t> col_labels_t;

/// wall-clock duration in seconds
typedef double seconds_t;

}
