#include "bibit/BinaryMatrixImportCSV.h"

#include <fstream>

#include <boost/filesystem.hpp>
#include <boost/tokenizer.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace bibit {

typedef boost::escaped_list_separator<char> csv_listsep_t;
typedef boost::tokenizer< boost::escaped_list_separator<char> > csvrow_tokenizer_t;

BibitIOParams::BibitIOParams()
    : csvColumnSeparator( '\t' )
    , rowNames( false )
    , colNames( false )
{
}

void BibitIOParams::checkFilenames() const
{
    boost::filesystem::path input_file_path( inputFilename );
    if ( !boost::filesystem::exists( input_file_path ) ) {
        THROW_RUNTIME_ERROR( "Input file not found: " << input_file_path );
    }
    if ( !boost::filesystem::is_regular_file( input_file_path ) ) {
        THROW_RUNTIME_ERROR( "Input path is not a file: " << input_file_path );
    }
}

namespace {

csvrow_tokenizer_t RowTokenizer( const std::string& row, char sep )
{
    return ( csvrow_tokenizer_t( row, csv_listsep_t( '\\', sep ) ) );
}

}

BinaryMatrix BinaryMatrixImportCSV(
    std::istream&   in,
    char            sep,
    bool            rowNames,
    bool            colNames
){
    BinaryMatrix::cells_type cells;
    row_labels_t rowLabels;
    col_labels_t colLabels;
    std::vector<binary_value_t> rowCells;

    std::string row;
    size_t lineIx = 0;
    bool header = colNames;
    while ( std::getline( in, row ) ) {
        lineIx++;
        if ( !row.empty() && row[ row.size() - 1 ] == '\r' ) row.erase( row.size() - 1 );
        if ( boost::trim_copy( row ).empty() ) continue;

        csvrow_tokenizer_t tokenizer = RowTokenizer( row, sep );
        if ( header ) {
            csvrow_tokenizer_t::const_iterator tokenIt = tokenizer.begin();
            // the corner cell above row labels is not a column label
            if ( rowNames && tokenIt != tokenizer.end() ) ++tokenIt;
            for ( ; tokenIt != tokenizer.end(); ++tokenIt ) {
                colLabels.push_back( boost::trim_copy( *tokenIt ) );
            }
            header = false;
            continue;
        }
        rowCells.clear();
        size_t colIx = 0;
        bool labelCell = rowNames;
        for ( csvrow_tokenizer_t::const_iterator tokenIt = tokenizer.begin(); tokenIt != tokenizer.end(); ++tokenIt ) {
            const std::string value = boost::trim_copy( *tokenIt );
            if ( labelCell ) {
                rowLabels.push_back( value );
                labelCell = false;
                continue;
            }
            colIx++;
            if ( value == "0" ) rowCells.push_back( 0 );
            else if ( value == "1" ) rowCells.push_back( 1 );
            else {
                THROW_INVALID_INPUT( "Non-binary value '" << value << "' at line " << lineIx
                                     << ", column #" << colIx );
            }
        }
        if ( cells.size1() > 0 && rowCells.size() != cells.size2() ) {
            THROW_INVALID_INPUT( "Line " << lineIx << " has " << rowCells.size()
                                 << " cells, " << cells.size2() << " expected" );
        }
        cells.push_back1( rowCells );
    }
    if ( !colLabels.empty() && cells.size1() > 0 && colLabels.size() != cells.size2() ) {
        THROW_INVALID_INPUT( colLabels.size() << " column labels given for "
                             << cells.size2() << " columns" );
    }

    BinaryMatrix res( cells );
    res.setRowLabels( rowLabels );
    if ( cells.size1() > 0 ) res.setColLabels( colLabels );
    return ( res );
}

BinaryMatrix BinaryMatrixImportCSV( const BibitIOParams& ioParams )
{
    ioParams.checkFilenames();
    LOG_INFO( "Loading binary matrix from CSV file " << ioParams.inputFilename << "..." );
    std::ifstream matrixStream( ioParams.inputFilename.c_str(), std::ios_base::in );
    if ( !matrixStream.good() ) {
        THROW_RUNTIME_ERROR( "Cannot read matrix file " << ioParams.inputFilename );
    }
    BinaryMatrix res = BinaryMatrixImportCSV( matrixStream, ioParams.csvColumnSeparator,
                                              ioParams.rowNames, ioParams.colNames );
    LOG_INFO( res.rowsCount() << "x" << res.colsCount() << " binary matrix loaded" );
    return ( res );
}

}
