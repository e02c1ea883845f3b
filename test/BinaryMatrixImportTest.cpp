#include <gtest/gtest.h>

#include <sstream>

#include <boost/filesystem/path.hpp>

#include "bibit/BinaryMatrixImportCSV.h"

#include "TestCommon.h"

using namespace bibit;

TEST( BinaryMatrixImport, plain_table )
{
    std::istringstream in( "1\t1\t0\t0\n1\t1\t0\t1\r\n\n1\t1\t1\t0\n 0 \t0\t1\t1\n" );
    const BinaryMatrix matrix = BinaryMatrixImportCSV( in );
    EXPECT_EQ( SmallTestMatrix(), matrix );
    EXPECT_TRUE( matrix.rowLabels().empty() );
    EXPECT_EQ( "3", matrix.rowLabel( 2 ) );
    EXPECT_EQ( "1", matrix.colLabel( 0 ) );
}

TEST( BinaryMatrixImport, custom_separator )
{
    std::istringstream in( "1,0,1\n0,1,1\n" );
    const BinaryMatrix matrix = BinaryMatrixImportCSV( in, ',' );
    EXPECT_EQ( 2, matrix.rowsCount() );
    EXPECT_EQ( 3, matrix.colsCount() );
    EXPECT_EQ( 1, matrix( 1, 2 ) );
    EXPECT_EQ( 0, matrix( 1, 0 ) );
    EXPECT_EQ( 2, matrix.rowOnes( 0 ) );
}

TEST( BinaryMatrixImport, non_binary_cell )
{
    std::istringstream in( "1\t0\n1\t2\n" );
    EXPECT_THROW( BinaryMatrixImportCSV( in ), std::invalid_argument );

    std::istringstream in2( "1\t0\n1\tx\n" );
    EXPECT_THROW( BinaryMatrixImportCSV( in2 ), std::invalid_argument );
}

TEST( BinaryMatrixImport, ragged_rows )
{
    std::istringstream in( "1\t0\t1\n1\t1\n" );
    EXPECT_THROW( BinaryMatrixImportCSV( in ), std::invalid_argument );

    std::istringstream in2( "a\tb\tc\n1\t1\n1\t0\n" );
    EXPECT_THROW( BinaryMatrixImportCSV( in2, '\t', false, true ), std::invalid_argument );
}

TEST( BinaryMatrixImport, from_strings )
{
    EXPECT_THROW( BinaryMatrix::FromStrings( std::vector<std::string>( 1, "102" ) ), std::invalid_argument );
    std::vector<std::string> rows;
    rows.push_back( "101" );
    rows.push_back( "10" );
    EXPECT_THROW( BinaryMatrix::FromStrings( rows ), std::invalid_argument );

    BinaryMatrix matrix = SmallTestMatrix();
    EXPECT_NO_THROW( matrix.checkBinary() );
    matrix( 3, 1 ) = 5;
    EXPECT_THROW( matrix.checkBinary(), std::invalid_argument );
    EXPECT_THROW( matrix.setRowLabels( row_labels_t( 3, "r" ) ), std::invalid_argument );
}

TEST( BinaryMatrixImport, labelled_file )
{
    BibitIOParams ioParams;
    ioParams.inputFilename = ( boost::filesystem::path( BIBITtest_data_path ) / "small_matrix.tsv" ).string();
    ioParams.rowNames = true;
    ioParams.colNames = true;

    const BinaryMatrix matrix = BinaryMatrixImportCSV( ioParams );
    EXPECT_EQ( SmallTestMatrix().cells(), matrix.cells() );
    ASSERT_EQ( 4, matrix.rowLabels().size() );
    ASSERT_EQ( 4, matrix.colLabels().size() );
    EXPECT_EQ( "s1", matrix.rowLabel( 0 ) );
    EXPECT_EQ( "s4", matrix.rowLabel( 3 ) );
    EXPECT_EQ( "f1", matrix.colLabel( 0 ) );
    EXPECT_EQ( "f4", matrix.colLabel( 3 ) );

    ioParams.inputFilename = ( boost::filesystem::path( BIBITtest_data_path ) / "missing.tsv" ).string();
    EXPECT_THROW( BinaryMatrixImportCSV( ioParams ), std::runtime_error );
}
