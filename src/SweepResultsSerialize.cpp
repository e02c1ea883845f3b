#include "bibit/SweepResultsSerialize.h"

#include <fstream>
#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/archive/xml_iarchive.hpp>
#include <boost/archive/xml_oarchive.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>

#include "bibit/misc_utils.h"

namespace bibit {

namespace {

template<class Archive, class InputStream>
void DeserializeResults(
    InputStream&    resultsStream,
    SweepResults&   results
){
    if ( !resultsStream.good() ) {
        THROW_RUNTIME_ERROR( "Error reading sweep results stream" );
    }
    Archive resultsArchive( resultsStream );
    resultsArchive >> boost::serialization::make_nvp( "sweep", results );
}

template<class Archive, class OutputStream>
void SerializeResults(
    OutputStream&       resultsStream,
    const SweepResults& results
){
    if ( !resultsStream.good() ) {
        THROW_RUNTIME_ERROR( "Error writing to sweep results stream" );
    }
    Archive resultsArchive( resultsStream );
    resultsArchive << boost::serialization::make_nvp( "sweep", results );
}

template<class Archive>
void LoadCompressed( const char* filename, SweepResults& results )
{
    std::ifstream resultsCompressedStream( filename, std::ios_base::in | std::ios_base::binary );
    if ( !resultsCompressedStream.good() ) {
        THROW_RUNTIME_ERROR( "Cannot read sweep results file " << filename );
    }
    boost::iostreams::filtering_stream<boost::iostreams::input> resultsStream;
    resultsStream.push( boost::iostreams::gzip_decompressor() );
    resultsStream.push( resultsCompressedStream );
    DeserializeResults<Archive>( resultsStream, results );
}

template<class Archive>
void SaveCompressed( const char* filename, const SweepResults& results )
{
    std::ofstream resultsCompressedStream( filename, std::ios_base::out | std::ios_base::binary );
    if ( !resultsCompressedStream.good() ) {
        THROW_RUNTIME_ERROR( "Cannot write sweep results file " << filename );
    }
    boost::iostreams::filtering_stream<boost::iostreams::output> resultsStream;
    resultsStream.push( boost::iostreams::gzip_compressor() );
    resultsStream.push( resultsCompressedStream );
    SerializeResults<Archive>( resultsStream, results );
}

}

SweepResults SweepResultsLoad( const char* filename )
{
    LOG_INFO( "Reading BiBit sweep results file " << filename << "..." );
    if ( !boost::filesystem::exists( filename ) ) {
        THROW_EXCEPTION( std::invalid_argument, "File '" << filename << "' not found" );
    }
    SweepResults res;
    if ( endsWith( filename, ".xml" ) ) {
        std::ifstream resultsStream( filename, std::ios_base::in );
        DeserializeResults<boost::archive::xml_iarchive>( resultsStream, res );
    }
    else if ( endsWith( filename, ".xml.gz" ) ) {
        LoadCompressed<boost::archive::xml_iarchive>( filename, res );
    }
    else if ( endsWith( filename, ".bar" ) ) {
        std::ifstream resultsStream( filename, std::ios_base::in | std::ios_base::binary );
        DeserializeResults<boost::archive::binary_iarchive>( resultsStream, res );
    }
    else if ( endsWith( filename, ".bar.gz" ) ) {
        LoadCompressed<boost::archive::binary_iarchive>( filename, res );
    }
    else {
        THROW_EXCEPTION( std::invalid_argument, "Unsupported extension of results file: " << filename );
    }
    return ( res );
}

void SweepResultsSave(
    const char*         filename,
    const SweepResults& results
){
    if ( endsWith( filename, ".xml" ) ) {
        std::ofstream resultsStream( filename, std::ios_base::out );
        SerializeResults<boost::archive::xml_oarchive>( resultsStream, results );
    }
    else if ( endsWith( filename, ".xml.gz" ) ) {
        SaveCompressed<boost::archive::xml_oarchive>( filename, results );
    }
    else if ( endsWith( filename, ".bar" ) ) {
        std::ofstream resultsStream( filename, std::ios_base::out | std::ios_base::binary );
        SerializeResults<boost::archive::binary_oarchive>( resultsStream, results );
    }
    else if ( endsWith( filename, ".bar.gz" ) ) {
        SaveCompressed<boost::archive::binary_oarchive>( filename, results );
    }
    else {
        THROW_EXCEPTION( std::invalid_argument, "Unsupported extension of results file: " << filename );
    }
}

void RunStatisticsWriteTSV(
    std::ostream&       out,
    const SweepResults& results
){
    out << "run\tbwl\tmnr\tmnc\tstatus\tbiclusters\trows_covered\tcols_covered"
        << "\tencode_time\tsearch_time\ttotal_time\tpairs\tduplicates\tgrown\n";
    for ( size_t i = 0; i < results.runs.size(); i++ ) {
        const RunStatistics& stats = results.runs[ i ].stats;
        out << ( stats.runIndex + 1 )
            << '\t' << stats.params.bitwordWidth
            << '\t' << stats.params.minRows
            << '\t' << stats.params.minCols
            << '\t' << RunStatusName( stats.status )
            << '\t' << stats.biclustersCount
            << '\t' << stats.coveredRowsCount()
            << '\t' << stats.coveredColsCount()
            << '\t' << stats.encodingTime
            << '\t' << stats.searchTime
            << '\t' << stats.totalTime
            << '\t' << stats.search.pairs
            << '\t' << stats.search.duplicatePatterns
            << '\t' << stats.search.candidates
            << '\n';
    }
}

void RunStatisticsSaveTSV(
    const char*         filename,
    const SweepResults& results
){
    LOG_INFO( "Saving run statistics to " << filename << "..." );
    std::ofstream statsStream( filename, std::ios_base::out );
    if ( !statsStream.good() ) {
        THROW_RUNTIME_ERROR( "Cannot write run statistics to " << filename );
    }
    RunStatisticsWriteTSV( statsStream, results );
}

}
