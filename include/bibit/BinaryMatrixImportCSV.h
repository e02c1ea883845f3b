#pragma once

#include "BasicTypedefs.h"

#include <istream>

#include "BinaryMatrix.h"

namespace bibit {

/**
 *  Input/output parameters of bibit-sweep.
 */
struct BibitIOParams {
    std::string     inputFilename;      /** binary matrix table */
    std::string     outputFilename;     /** serialized sweep results */
    std::string     statsFilename;      /** run statistics table */
    char            csvColumnSeparator;
    bool            rowNames;           /** the first column contains row labels */
    bool            colNames;           /** the first row contains column labels */

    BibitIOParams();

    void checkFilenames() const;
};

/**
 *  Imports binary matrix from the delimited text stream.
 *  Each line is a matrix row, cells should be 0 or 1,
 *  optionally the first line contains column labels,
 *  and the first cell of each line contains row label.
 *  Empty lines are skipped.
 *
 *  Throws std::invalid_argument on non-binary cells and rows of different length.
 */
BinaryMatrix BinaryMatrixImportCSV(
    std::istream&   in,
    char            sep = '\t',
    bool            rowNames = false,
    bool            colNames = false
);

BinaryMatrix BinaryMatrixImportCSV( const BibitIOParams& ioParams );

}
