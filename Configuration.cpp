/*==============================================================================
Configuration

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <fstream>                   // Configuration files
#include <sstream>                   // Default configuration
#include <map>                       // Enumeration names

#include "Errors.hpp"
#include "Configuration.hpp"

namespace Taskforce
{

namespace po = boost::program_options;

// The enumerations are given by name, and the names are mapped to values
// with a map per enumeration.

namespace
{
template< class EnumType >
EnumType Lookup( const std::map< std::string, EnumType > & Names,
                 const std::string & Value, const char * Option )
{
  auto Found = Names.find( Value );

  if ( Found != Names.end() )
    return Found->second;

  std::ostringstream ErrorMessage;

  ErrorMessage << "The option " << Option << " = " << Value
               << " is not one of";

  for ( const auto & [ Name, EnumValue ] : Names )
    ErrorMessage << " " << Name;

  throw ConfigurationError( ErrorMessage.str() );
}
}

/*==============================================================================

 Options

==============================================================================*/

Configuration::Configuration( void )
: Options( "Taskforce options" ), Values()
{
  po::options_description General( "General" );
  General.add_options()
    ( "help,h", "display this help" )
    ( "config,c", po::value< std::string >(), "configuration file" )
    ( "log.level", po::value< std::string >()->default_value( "info" ),
      "trace, debug, info, warning, or error" );

  po::options_description WorkerOptions( "Worker" );
  WorkerOptions.add_options()
    ( "worker.capacity", po::value< std::size_t >()->default_value( 0 ),
      "mailbox capacity, 0 for unbounded" )
    ( "worker.full-policy", po::value< std::string >()->default_value( "block" ),
      "block or fail when the mailbox is full" )
    ( "worker.ordering", po::value< std::string >()->default_value( "priority" ),
      "fifo or priority ordering of pending tasks" );

  po::options_description PoolOptions( "Pool" );
  PoolOptions.add_options()
    ( "pool.workers", po::value< std::size_t >()->default_value( 4 ),
      "number of workers" )
    ( "pool.selection", po::value< std::string >()->default_value( "round-robin" ),
      "round-robin or least-loaded" )
    ( "pool.on-terminated", po::value< std::string >()->default_value( "retry" ),
      "fail or retry when the selected worker has terminated" )
    ( "pool.drain", po::value< std::string >()->default_value( "drain" ),
      "drain or stop workers removed by a resize" );

  po::options_description SupervisorOptions( "Supervisor" );
  SupervisorOptions.add_options()
    ( "supervisor.max-restarts", po::value< unsigned int >()->default_value( 3 ),
      "restarts allowed within the window" )
    ( "supervisor.window", po::value< long >()->default_value( 60000 ),
      "restart window in milliseconds" )
    ( "supervisor.backoff",
      po::value< std::string >()->default_value( "exponential" ),
      "constant, linear, or exponential" )
    ( "supervisor.base-delay", po::value< long >()->default_value( 100 ),
      "base restart delay in milliseconds" )
    ( "supervisor.max-delay", po::value< long >()->default_value( 10000 ),
      "maximal restart delay in milliseconds" );

  po::options_description BreakerOptions( "Circuit breaker" );
  BreakerOptions.add_options()
    ( "breaker.enabled", po::value< bool >()->default_value( false ),
      "guard pools with a circuit breaker" )
    ( "breaker.failure-threshold",
      po::value< unsigned int >()->default_value( 5 ),
      "consecutive failures opening the breaker" )
    ( "breaker.open-timeout", po::value< long >()->default_value( 1000 ),
      "milliseconds before an open breaker admits a probe" )
    ( "breaker.probe-successes",
      po::value< unsigned int >()->default_value( 1 ),
      "successful probes closing the breaker" )
    ( "breaker.window", po::value< long >()->default_value( 0 ),
      "failure observation window in milliseconds, 0 for none" );

  po::options_description LimiterOptions( "Rate limiter" );
  LimiterOptions.add_options()
    ( "limiter.enabled", po::value< bool >()->default_value( false ),
      "guard pools with a rate limiter" )
    ( "limiter.limit", po::value< std::size_t >()->default_value( 100 ),
      "admissions within the window" )
    ( "limiter.window", po::value< long >()->default_value( 1000 ),
      "window in milliseconds" );

  Options.add( General ).add( WorkerOptions ).add( PoolOptions )
         .add( SupervisorOptions ).add( BreakerOptions ).add( LimiterOptions );

  // The defaults are stored so that the parameters can be produced also
  // if nothing is parsed.

  std::istringstream Empty;
  Parse( Empty );
}

/*==============================================================================

 Parsing

==============================================================================*/

void Configuration::Parse( int argc, const char * const argv[] )
{
  try
  {
    po::store( po::parse_command_line( argc, argv, Options ), Values );

    if ( Values.count( "config" ) )
    {
      std::string FileName( Get< std::string >( "config" ) );
      std::ifstream ConfigurationFile( FileName );

      if ( !ConfigurationFile )
        throw ConfigurationError( "The configuration file " + FileName
                                  + " cannot be opened" );

      po::store( po::parse_config_file( ConfigurationFile, Options ), Values );
    }

    po::notify( Values );
  }
  catch ( const po::error & Failure )
  {
    throw ConfigurationError( Failure.what() );
  }
}

void Configuration::Parse( std::istream & ConfigurationStream )
{
  try
  {
    po::store( po::parse_config_file( ConfigurationStream, Options ), Values );
    po::notify( Values );
  }
  catch ( const po::error & Failure )
  {
    throw ConfigurationError( Failure.what() );
  }
}

bool Configuration::HelpRequested( void ) const
{
  return Values.count( "help" ) > 0;
}

void Configuration::PrintHelp( std::ostream & Output ) const
{
  Output << Options << std::endl;
}

std::chrono::milliseconds Configuration::Duration( const char * Option ) const
{
  long Milliseconds = Get< long >( Option );

  if ( Milliseconds < 0 )
    throw ConfigurationError( "The duration " + std::string( Option ) + " = "
                              + std::to_string( Milliseconds )
                              + " ms is negative" );

  return std::chrono::milliseconds( Milliseconds );
}

/*==============================================================================

 Parameters

==============================================================================*/

Worker::Parameters Configuration::WorkerParameters( void ) const
{
  static const std::map< std::string, Mailbox::FullPolicy > Policies{
    { "block", Mailbox::FullPolicy::Block },
    { "fail",  Mailbox::FullPolicy::Fail  } };

  static const std::map< std::string, Mailbox::Ordering > Orderings{
    { "fifo",     Mailbox::Ordering::Arrival  },
    { "priority", Mailbox::Ordering::Priority } };

  return Worker::Parameters(
    Get< std::size_t >( "worker.capacity" ),
    Lookup( Policies, Get< std::string >( "worker.full-policy" ),
            "worker.full-policy" ),
    Lookup( Orderings, Get< std::string >( "worker.ordering" ),
            "worker.ordering" ) );
}

WorkerPool::Parameters Configuration::PoolParameters( void ) const
{
  static const std::map< std::string, WorkerPool::Selection > Selections{
    { "round-robin",  WorkerPool::Selection::RoundRobin  },
    { "least-loaded", WorkerPool::Selection::LeastLoaded } };

  static const std::map< std::string, WorkerPool::OnTerminated > Terminated{
    { "fail",  WorkerPool::OnTerminated::Fail  },
    { "retry", WorkerPool::OnTerminated::Retry } };

  static const std::map< std::string, WorkerPool::DrainPolicy > Drains{
    { "drain", WorkerPool::DrainPolicy::Drain },
    { "stop",  WorkerPool::DrainPolicy::Stop  } };

  return WorkerPool::Parameters(
    Get< std::size_t >( "pool.workers" ),
    Lookup( Selections, Get< std::string >( "pool.selection" ),
            "pool.selection" ),
    Lookup( Terminated, Get< std::string >( "pool.on-terminated" ),
            "pool.on-terminated" ),
    Lookup( Drains, Get< std::string >( "pool.drain" ), "pool.drain" ),
    WorkerParameters() );
}

Supervisor::Parameters Configuration::SupervisorParameters( void ) const
{
  static const std::map< std::string, Supervisor::Backoff > Strategies{
    { "constant",    Supervisor::Backoff::Constant    },
    { "linear",      Supervisor::Backoff::Linear      },
    { "exponential", Supervisor::Backoff::Exponential } };

  std::chrono::milliseconds Window( Duration( "supervisor.window" ) ),
                            BaseDelay( Duration( "supervisor.base-delay" ) ),
                            MaxDelay( Duration( "supervisor.max-delay" ) );

  if ( MaxDelay < BaseDelay )
    throw ConfigurationError( "The maximal restart delay is shorter than the "
                              "base delay" );

  return Supervisor::Parameters(
    Get< unsigned int >( "supervisor.max-restarts" ), Window,
    Lookup( Strategies, Get< std::string >( "supervisor.backoff" ),
            "supervisor.backoff" ),
    BaseDelay, MaxDelay );
}

CircuitBreaker::Parameters Configuration::BreakerParameters( void ) const
{
  unsigned int Threshold = Get< unsigned int >( "breaker.failure-threshold" ),
               Probes    = Get< unsigned int >( "breaker.probe-successes" );

  if ( Threshold == 0 || Probes == 0 )
    throw ConfigurationError( "The breaker failure threshold and probe "
                              "successes must be positive" );

  std::chrono::milliseconds Window( Duration( "breaker.window" ) );
  std::optional< CircuitBreaker::Clock::duration > ObservationWindow;

  if ( Window.count() > 0 )
    ObservationWindow = Window;

  return CircuitBreaker::Parameters( Threshold,
                                     Duration( "breaker.open-timeout" ),
                                     Probes, ObservationWindow );
}

RateLimiter::Parameters Configuration::LimiterParameters( void ) const
{
  std::size_t Limit = Get< std::size_t >( "limiter.limit" );
  std::chrono::milliseconds Window( Duration( "limiter.window" ) );

  if ( Limit == 0 || Window.count() == 0 )
    throw ConfigurationError( "The rate limiter needs a positive limit and "
                              "window" );

  return RateLimiter::Parameters( Limit, Window );
}

ConsoleOutput::Severity Configuration::LogLevel( void ) const
{
  return ConsoleOutput::ToSeverity( Get< std::string >( "log.level" ) );
}

bool Configuration::BreakerEnabled( void ) const
{
  return Get< bool >( "breaker.enabled" );
}

bool Configuration::LimiterEnabled( void ) const
{
  return Get< bool >( "limiter.enabled" );
}

}  // Name space Taskforce
