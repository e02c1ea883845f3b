#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include "bibit/misc_utils.h"

#include "ParametersReader.h"

namespace po = boost::program_options;

namespace bibit {

namespace {

void check_output_folder( const po::variables_map& opt_map, const char* option )
{
    if ( opt_map.count( option ) == 0 ) return;

    boost::filesystem::path out_path( opt_map[ option ].as<std::string>() );
    if ( !out_path.parent_path().empty()
     && !boost::filesystem::exists( out_path.parent_path() )
    ){
        THROW_EXCEPTION( std::invalid_argument, "Output folder doesn't exist: " << out_path.parent_path() );
    }
    if ( !out_path.parent_path().empty()
     && !boost::filesystem::is_directory( out_path.parent_path() )
    ){
        THROW_EXCEPTION( std::invalid_argument, "Output path is not a folder: " << out_path.parent_path() );
    }
}

}

bool BibitParamsRead(
    int argc, char* argv[],
    SweepParams&            sweepParams,
    SyntheticMatrixParams&  simulationParams,
    BibitIOParams&          ioParams,
    BibitDriverParams&      driverParams
){
    // Declare the supported options
    po::positional_options_description p;
    p.add( "input_file", -1 );

    po::options_description basic_cmdline_options_desc( "Program options" );

    basic_cmdline_options_desc.add_options()
        ( "help", "options description" )
        ( "config_file", po::value< std::string >(),
          "configuration (.INI) file" )
        ( "input_file", po::value< std::string >( &ioParams.inputFilename ),
          "binary matrix table, one row per line, cells are 0 or 1" )
        ( "csv_column_separator", po::value<char>( &ioParams.csvColumnSeparator )->default_value( ioParams.csvColumnSeparator ),
          "input table column separator (TAB used by default)" )
        ( "row_names", po::value<bool>( &ioParams.rowNames )->default_value( ioParams.rowNames ),
          "the first column of the input table contains row labels" )
        ( "col_names", po::value<bool>( &ioParams.colNames )->default_value( ioParams.colNames ),
          "the first line of the input table contains column labels" )

        ( "output_file", po::value< std::string >( &ioParams.outputFilename ),
          "sweep results file (.xml, .xml.gz, .bar or .bar.gz)" )
        ( "stats_file", po::value< std::string >( &ioParams.statsFilename ),
          "run statistics table (tab-separated)" )
        ( "verbosity", po::value<int>( &driverParams.verbosity )->default_value( driverParams.verbosity ),
          "progress reporting level, 0 to disable" )
        ( "estimate_only", po::bool_switch( &driverParams.estimateOnly ),
          "print the sweep cost estimate and exit" )
    ;

    po::options_description sweep_options_desc( "Sweep parameters" );
    sweep_options_desc.add_options()
        ( "bwl", po::value< std::string >(),
          "bitword lengths, e.g. 2:8 or 4,8,16 (default 2 to ceil(log2(columns)))" )
        ( "min_rows", po::value< std::string >()->default_value( "2:10" ),
          "minimal numbers of bicluster rows" )
        ( "min_cols", po::value< std::string >()->default_value( "2:10" ),
          "minimal numbers of bicluster columns" )
        ( "threads", po::value< size_t >( &sweepParams.threads )->default_value( sweepParams.threads ),
          "number of runs executed in parallel" )
        ( "search_threads", po::value< size_t >( &sweepParams.searchThreads )->default_value( sweepParams.searchThreads ),
          "number of threads used by a single run" )
        ( "run_time_limit", po::value< seconds_t >( &sweepParams.runTimeLimit )->default_value( sweepParams.runTimeLimit ),
          "max duration of a single run in seconds, 0 for no limit" )
        ( "keep_biclusters", po::value< bool >( &sweepParams.keepBiclusters )->default_value( sweepParams.keepBiclusters ),
          "store the biclusters in the results file, otherwise only the statistics" )
    ;

    po::options_description simulate_options_desc( "Synthetic matrix parameters" );
    simulate_options_desc.add_options()
        ( "simulate.rows", po::value< size_t >( &simulationParams.rowsCount )->default_value( simulationParams.rowsCount ),
          "rows of the synthetic matrix, used instead of --input_file if positive" )
        ( "simulate.cols", po::value< size_t >( &simulationParams.colsCount )->default_value( simulationParams.colsCount ),
          "columns of the synthetic matrix" )
        ( "simulate.density", po::value< double >( &simulationParams.density )->default_value( simulationParams.density ),
          "probability of 1 in the background" )
        ( "simulate.biclusters", po::value< size_t >( &simulationParams.biclustersCount )->default_value( simulationParams.biclustersCount ),
          "number of planted biclusters" )
        ( "simulate.bicluster_rows", po::value< size_t >( &simulationParams.biclusterRows )->default_value( simulationParams.biclusterRows ),
          "rows of each planted bicluster" )
        ( "simulate.bicluster_cols", po::value< size_t >( &simulationParams.biclusterCols )->default_value( simulationParams.biclusterCols ),
          "columns of each planted bicluster" )
        ( "simulate.seed", po::value< unsigned long >( &simulationParams.seed )->default_value( simulationParams.seed ),
          "random generator seed" )
    ;

    po::options_description all_cmdline_options_desc = basic_cmdline_options_desc;
    all_cmdline_options_desc
        .add( sweep_options_desc )
        .add( simulate_options_desc )
    ;

    po::variables_map opt_map;
    po::store( po::command_line_parser( argc, argv )
                .options( all_cmdline_options_desc )
                .positional( p ).run(), opt_map );

    if ( opt_map.count( "help" ) ) {
        std::cout << all_cmdline_options_desc;
        return ( false );
    }
    po::options_description all_config_options_desc( "Configuration file parameters" );
    all_config_options_desc
        .add( sweep_options_desc )
        .add( simulate_options_desc )
    ;

    if ( opt_map.count( "config_file" ) ) {
        po::store( po::parse_config_file<char>( opt_map["config_file"].as<std::string>().c_str(),
                                                all_config_options_desc ),
                    opt_map );
    }
    po::notify( opt_map );

    check_output_folder( opt_map, "output_file" );
    check_output_folder( opt_map, "stats_file" );

    if ( opt_map.count( "input_file" ) == 0 && !simulationParams.enabled() ) {
        THROW_RUNTIME_ERROR( "No input file defined and no matrix simulation requested" );
    }

    sweepParams.bitwordWidths.clear();
    if ( opt_map.count( "bwl" ) > 0 ) {
        sweepParams.bitwordWidths = parseIndexRange( opt_map["bwl"].as<std::string>() );
    }
    sweepParams.minRows = parseIndexRange( opt_map["min_rows"].as<std::string>() );
    sweepParams.minCols = parseIndexRange( opt_map["min_cols"].as<std::string>() );

    return ( true );
}

}
