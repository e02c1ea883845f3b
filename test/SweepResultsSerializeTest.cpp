#include <gtest/gtest.h>

#include <sstream>

#include <boost/filesystem.hpp>

#include "bibit/SweepResultsSerialize.h"

#include "TestCommon.h"

using namespace bibit;

class SweepResultsSerializeTest: public ::testing::Test {
protected:
    boost::filesystem::path tmpFolder;
    SweepResults            results;

    SweepResultsSerializeTest()
    : tmpFolder( boost::filesystem::temp_directory_path() / boost::filesystem::unique_path( "bibit-test-%%%%-%%%%" ) )
    {
        boost::filesystem::create_directories( tmpFolder );

        BinaryMatrix matrix = SmallTestMatrix();
        row_labels_t rowLabels;
        for ( size_t i = 0; i < matrix.rowsCount(); i++ ) {
            rowLabels.push_back( "s" + matrix.rowLabel( i ) );
        }
        matrix.setRowLabels( rowLabels );
        SweepParams params;
        params.bitwordWidths.assign( 1, 4 );
        params.minRows.assign( 1, 2 );
        params.minCols.clear();
        params.minCols.push_back( 2 );
        params.minCols.push_back( 3 );
        results = ParameterSweep_run( matrix, params );
    }

    virtual ~SweepResultsSerializeTest()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all( tmpFolder, ec );
    }

    void checkLoaded( const SweepResults& loaded ) const
    {
        EXPECT_EQ( results.rowLabels, loaded.rowLabels );
        EXPECT_EQ( results.colLabels, loaded.colLabels );
        ASSERT_EQ( results.runs.size(), loaded.runs.size() );
        for ( size_t i = 0; i < results.runs.size(); i++ ) {
            const RunStatistics& stats = results.runs[i].stats;
            const RunStatistics& loadedStats = loaded.runs[i].stats;
            EXPECT_EQ( stats.params, loadedStats.params );
            EXPECT_EQ( stats.status, loadedStats.status );
            EXPECT_EQ( stats.biclustersCount, loadedStats.biclustersCount );
            EXPECT_EQ( stats.coveredRows, loadedStats.coveredRows );
            EXPECT_EQ( stats.search.duplicatePatterns, loadedStats.search.duplicatePatterns );
            EXPECT_EQ( results.runs[i].biclusters, loaded.runs[i].biclusters );
        }
    }
};

TEST_F( SweepResultsSerializeTest, xml )
{
    const std::string filename = ( tmpFolder / "results.xml" ).string();
    SweepResultsSave( filename.c_str(), results );
    ASSERT_TRUE( boost::filesystem::exists( filename ) );
    checkLoaded( SweepResultsLoad( filename.c_str() ) );
}

TEST_F( SweepResultsSerializeTest, compressed_binary )
{
    const std::string filename = ( tmpFolder / "results.bar.gz" ).string();
    SweepResultsSave( filename.c_str(), results );
    checkLoaded( SweepResultsLoad( filename.c_str() ) );
}

TEST_F( SweepResultsSerializeTest, compressed_xml )
{
    const std::string filename = ( tmpFolder / "results.xml.gz" ).string();
    SweepResultsSave( filename.c_str(), results );
    checkLoaded( SweepResultsLoad( filename.c_str() ) );
}

TEST_F( SweepResultsSerializeTest, binary )
{
    const std::string filename = ( tmpFolder / "results.bar" ).string();
    SweepResultsSave( filename.c_str(), results );
    checkLoaded( SweepResultsLoad( filename.c_str() ) );
}

TEST_F( SweepResultsSerializeTest, unwritable_file )
{
    const boost::filesystem::path missingFolder = tmpFolder / "missing";
    EXPECT_THROW( SweepResultsSave( ( missingFolder / "results.xml.gz" ).string().c_str(), results ),
                  std::runtime_error );
    EXPECT_THROW( SweepResultsSave( ( missingFolder / "results.bar.gz" ).string().c_str(), results ),
                  std::runtime_error );
    EXPECT_THROW( SweepResultsSave( ( missingFolder / "results.xml" ).string().c_str(), results ),
                  std::runtime_error );
    EXPECT_FALSE( boost::filesystem::exists( missingFolder ) );
}

TEST_F( SweepResultsSerializeTest, unsupported_extension )
{
    const std::string filename = ( tmpFolder / "results.txt" ).string();
    EXPECT_THROW( SweepResultsSave( filename.c_str(), results ), std::invalid_argument );
    EXPECT_THROW( SweepResultsLoad( ( tmpFolder / "missing.xml" ).string().c_str() ), std::invalid_argument );
}

TEST_F( SweepResultsSerializeTest, statistics_table )
{
    std::ostringstream out;
    RunStatisticsWriteTSV( out, results );

    std::istringstream in( out.str() );
    std::string line;
    ASSERT_TRUE( std::getline( in, line ) );
    EXPECT_EQ( "run\tbwl\tmnr\tmnc\tstatus\tbiclusters\trows_covered\tcols_covered"
               "\tencode_time\tsearch_time\ttotal_time\tpairs\tduplicates\tgrown", line );
    ASSERT_TRUE( std::getline( in, line ) );
    EXPECT_EQ( 0, line.find( "1\t4\t2\t2\tcompleted\t1\t3\t2\t" ) );
    ASSERT_TRUE( std::getline( in, line ) );
    EXPECT_EQ( 0, line.find( "2\t4\t2\t3\tcompleted\t0\t0\t0\t" ) );
    EXPECT_FALSE( std::getline( in, line ) );
}
