#pragma once

#include "BasicTypedefs.h"

#include <mutex>

#include <boost/timer/timer.hpp>

#include "SweepExecutionMonitor.h"

namespace bibit {

/**
    SweepExecutionMonitor writing to textual console.
 */
class ConsoleSweepExecutionMonitor: public SweepExecutionMonitor
{
private:
    boost::timer::cpu_timer _timer;
    std::mutex      _mutex;
    size_t          _runsCount;     /// total number of runs
    size_t          _runsFinished;  /// runs finished so far
    size_t          _runsFailed;
    size_t          _runsCancelled;
    size_t          _reportPeriod;  /// period (# of finished runs) of progress reports

protected:
    virtual void print( const std::string& line ) = 0;

public:
    ConsoleSweepExecutionMonitor( log_level_t verbosity = 0, size_t reportPeriod = 10 );

    virtual ~ConsoleSweepExecutionMonitor()
    {}

    virtual void log( log_level_t level, const std::string& message );

    virtual void notifySweepStarted( const SweepParams& params, const SweepCostEstimate& cost );
    virtual void notifyRunStarted( size_t runIndex, const RunParameters& params );
    virtual void notifyRunFinished( const RunStatistics& stats );
    virtual void notifySweepFinished( const SweepResults& results );

    size_t runsFinished() const {
        return ( _runsFinished );
    }
};

/**
    SweepExecutionMonitor printing to STDOUT of the process.
 */
class StdOutSweepExecutionMonitor: public ConsoleSweepExecutionMonitor {
protected:
    virtual void print( const std::string& line );

public:
    StdOutSweepExecutionMonitor( log_level_t verbosity = 0, size_t reportPeriod = 10 )
    : ConsoleSweepExecutionMonitor( verbosity, reportPeriod )
    {}
    virtual ~StdOutSweepExecutionMonitor()
    {}
};

}
