#pragma once

#include "BasicTypedefs.h"

#include <ostream>

#include "ParameterSweep.h"

namespace bibit {

/**
 *  Loads sweep results saved by SweepResultsSave().
 *  The archive format is defined by the file extension:
 *  .xml, .xml.gz, .bar (binary), .bar.gz.
 */
SweepResults SweepResultsLoad( const char* filename );

void SweepResultsSave( const char* filename, const SweepResults& results );

/**
 *  Writes run statistics table (tab-separated, one run per line).
 */
void RunStatisticsWriteTSV( std::ostream& out, const SweepResults& results );

void RunStatisticsSaveTSV( const char* filename, const SweepResults& results );

}
