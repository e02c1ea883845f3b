#pragma once

#include "BasicTypedefs.h"

#include <sstream>

#include "ParameterSweep.h"

namespace bibit {

/**
    ParameterSweep_run() execution monitor.

    Run notifications are sent from the sweep worker threads,
    implementations should be thread-safe.
 */
class SweepExecutionMonitor {
public:
    typedef int log_level_t;

    /**
        Proxy class to buffer message string
        and ouput it to execution monitor upon
        destruction.
     */
    class LogMessage {
    protected:
        friend class SweepExecutionMonitor;

        std::ostringstream          _msg;
        SweepExecutionMonitor&      _parent;
        log_level_t                 _level;
        bool                        _enabled;

        LogMessage( SweepExecutionMonitor& parent,
                    log_level_t level, bool enabled )
        : _parent( parent ), _level( level ), _enabled( enabled )
        {}

    public:
        LogMessage( const LogMessage& logMsg )
        : _parent( logMsg._parent ), _level( logMsg._level ), _enabled( logMsg._enabled )
        {
            _msg << logMsg._msg.str();
        }

        ~LogMessage()
        {
            if ( _enabled && _msg.tellp() > 0 ) {
                _parent.log( _level, _msg.str() );
            }
        }

        bool enabled() const {
            return ( _enabled );
        }

        template<class Printable>
        friend LogMessage& operator<<( LogMessage& out, const Printable& a )
        {
            if ( out._enabled ) out._msg << a;
            return ( out );
        }
    };

private:
    log_level_t _verbosity;

public:
    SweepExecutionMonitor( log_level_t verbosity = 0 )
    : _verbosity( verbosity )
    {}

    virtual ~SweepExecutionMonitor()
    {}

    virtual void log( log_level_t level, const std::string& message ) = 0;

    LogMessage logOutput( log_level_t level )
    {
        return ( LogMessage( *this, level, level <= verbosity() ) );
    }

    virtual void notifySweepStarted( const SweepParams& params, const SweepCostEstimate& cost ) = 0;
    virtual void notifyRunStarted( size_t runIndex, const RunParameters& params ) = 0;
    virtual void notifyRunFinished( const RunStatistics& stats ) = 0;
    virtual void notifySweepFinished( const SweepResults& results ) = 0;

    log_level_t verbosity() const
    {
        return ( _verbosity );
    }
};

}
