/*==============================================================================
Configuration

The parameters of the workers, the pools, the supervisors, the circuit
breakers, and the rate limiters can be given on the command line or in a
configuration file in the INI format read by Boost program options. The
options are grouped by component, and the group is the section of the
configuration file:

  [pool]
  workers = 4
  selection = least-loaded

  [supervisor]
  max-restarts = 3
  backoff = exponential

which is equivalent to the command line options --pool.workers=4 and so on.
The configuration file is given with the --config option, and values given on
the command line take precedence over the values in the file. All durations
are given in milliseconds.

The configuration is parsed once, and then the parameter structures of the
components are produced from the parsed values. Values that cannot be
interpreted, like an unknown back off strategy, give a Configuration Error
naming the option.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_CONFIGURATION
#define TASKFORCE_CONFIGURATION

#include <string>                    // Option names
#include <istream>                   // Configuration streams
#include <ostream>                   // Printing help

#include <boost/program_options.hpp> // Parsing options

#include "Utility/ConsoleOutput.hpp"
#include "Worker.hpp"
#include "WorkerPool.hpp"
#include "Supervisor.hpp"
#include "CircuitBreaker.hpp"
#include "RateLimiter.hpp"

namespace Taskforce
{

class Configuration
{
private:

  boost::program_options::options_description Options;
  boost::program_options::variables_map       Values;

  template< class ValueType >
  ValueType Get( const char * Option ) const
  { return Values[ Option ].as< ValueType >(); }

  // Durations are read as milliseconds and must not be negative

  std::chrono::milliseconds Duration( const char * Option ) const;

public:

  // The command line is parsed first, and then the configuration file given
  // by the --config option, if any.

  void Parse( int argc, const char * const argv[] );

  // Configuration read from a stream, typically for tests or for embedded
  // configurations.

  void Parse( std::istream & ConfigurationStream );

  bool HelpRequested( void ) const;
  void PrintHelp( std::ostream & Output ) const;

  Worker::Parameters         WorkerParameters( void ) const;
  WorkerPool::Parameters     PoolParameters( void ) const;
  Supervisor::Parameters     SupervisorParameters( void ) const;
  CircuitBreaker::Parameters BreakerParameters( void ) const;
  RateLimiter::Parameters    LimiterParameters( void ) const;
  ConsoleOutput::Severity    LogLevel( void ) const;

  // The breaker and the limiter are only used when enabled

  bool BreakerEnabled( void ) const;
  bool LimiterEnabled( void ) const;

  Configuration( void );

  Configuration( const Configuration & Other ) = delete;
  Configuration & operator = ( const Configuration & Other ) = delete;
};

}      // Name space Taskforce
#endif // TASKFORCE_CONFIGURATION
