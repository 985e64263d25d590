/*=============================================================================
  Pool Demo

  The purpose of this small programme is to illustrate how the components of
  the Taskforce runtime are combined: a pool of workers guarded by a rate
  limiter and a circuit breaker, and supervised by a supervisor that restarts
  the pool's workers when they fail.

  The tasks count the prime numbers below a limit given as the payload. Some
  of the tasks are given a negative limit, which the computation treats as an
  ordinary error, and a few tasks report that the worker's execution context is
  corrupted by throwing a fatal fault. The supervisor will then restart the
  failed worker, and the tasks waiting in its mailbox are executed by the
  restarted worker.

  The parameters are read from the command line and from the configuration
  file given with --config, see Examples/PoolDemo.ini for an example. The
  programme reports the outcome of every task and a summary at the end.

  Author and Copyright: Geir Horn, University of Oslo
  License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
=============================================================================*/

#include <iostream>                  // Reporting results
#include <memory>                    // Shared pointers
#include <stdexcept>                 // Standard exceptions
#include <chrono>                    // Waiting for results
#include <cstdlib>                   // Exit codes

#include "Errors.hpp"
#include "Task.hpp"
#include "WorkerPool.hpp"
#include "Supervisor.hpp"
#include "Configuration.hpp"
#include "Utility/ConsoleOutput.hpp"

/*=============================================================================

 Computation

=============================================================================*/

// Counting primes by trial division is slow enough to keep the workers busy

static long CountPrimes( const long & Limit )
{
  if ( Limit < 0 )
    throw std::invalid_argument( "Cannot count primes below a negative limit" );

  long Primes = 0;

  for ( long Candidate = 2; Candidate < Limit; Candidate++ )
  {
    bool Prime = true;

    for ( long Divisor = 2; Divisor * Divisor <= Candidate && Prime; Divisor++ )
      Prime = ( Candidate % Divisor != 0 );

    if ( Prime ) Primes++;
  }

  return Primes;
}

static long CorruptedContext( const long & Limit )
{
  throw Taskforce::WorkerFatalFault( "Corrupted context while counting to "
                                     + std::to_string( Limit ) );
}

/*=============================================================================

 Main

=============================================================================*/

int main( int argc, char ** argv )
{
  constexpr std::size_t NumberOfTasks = 40;

  Taskforce::Configuration Settings;

  try
  {
    Settings.Parse( argc, argv );
  }
  catch ( const Taskforce::ConfigurationError & Failure )
  {
    std::cerr << Failure.what() << std::endl;
    return EXIT_FAILURE;
  }

  if ( Settings.HelpRequested() )
  {
    Settings.PrintHelp( std::cout );
    return EXIT_SUCCESS;
  }

  Taskforce::ConsoleOutput::SetThreshold( Settings.LogLevel() );

  // The optional guards of the pool

  std::shared_ptr< Taskforce::RateLimiter >    Limiter;
  std::shared_ptr< Taskforce::CircuitBreaker > Breaker;

  if ( Settings.LimiterEnabled() )
    Limiter = std::make_shared< Taskforce::RateLimiter >(
      Settings.LimiterParameters(), &Taskforce::RateLimiter::Clock::now,
      "DemoLimiter" );

  if ( Settings.BreakerEnabled() )
    Breaker = std::make_shared< Taskforce::CircuitBreaker >(
      Settings.BreakerParameters(), &Taskforce::CircuitBreaker::Clock::now,
      "DemoBreaker" );

  // The collector must outlive the pool since the workers deliver to it, and
  // the supervisor must be destroyed before the pool it manages.

  auto Results = std::make_shared< Taskforce::ResultCollector >();

  Taskforce::WorkerPool Pool( "DemoPool", Settings.PoolParameters(),
                              Limiter, Breaker );
  Taskforce::Supervisor Guardian( "DemoSupervisor",
                                  Settings.SupervisorParameters() );

  Guardian.Manage( Pool );

  // Every seventh task is given a negative limit, and every seventeenth task
  // corrupts its worker. Every fifth task is urgent.

  std::size_t Accepted = 0, Rejected = 0;

  for ( std::size_t i = 1; i <= NumberOfTasks; i++ )
  {
    long Limit = ( i % 7 == 0 ) ? -1 : static_cast< long >( 20000 * i );
    Taskforce::Task::Priority Urgency = ( i % 5 == 0 ) ? 10 : 0;

    try
    {
      if ( i % 17 == 0 )
        Pool.Submit( Taskforce::MakeTask( &CorruptedContext, Limit, Urgency,
                                          Results ) );
      else
        Pool.Submit( Taskforce::MakeTask( &CountPrimes, Limit, Urgency,
                                          Results ) );

      Accepted++;
    }
    catch ( const Taskforce::Error & Refused )
    {
      Rejected++;

      Taskforce::ConsoleOutput( Taskforce::ConsoleOutput::Severity::Warning,
                                "PoolDemo" )
        << "Task " << i << " refused: " << Refused.Kind << std::endl;
    }
  }

  if ( !Results->WaitForCount( Accepted, std::chrono::seconds( 60 ) ) )
    Taskforce::ConsoleOutput( Taskforce::ConsoleOutput::Severity::Error,
                              "PoolDemo" )
      << "Only " << Results->Count() << " of " << Accepted
      << " results arrived in time" << std::endl;

  // Reporting the outcomes in the order they arrived

  std::size_t Succeeded = 0;

  while ( auto Outcome = Results->Next( std::chrono::milliseconds( 0 ) ) )
    if ( Outcome->IsSuccess() )
    {
      Succeeded++;
      std::cout << "Task " << Outcome->TaskID() << " found "
                << Outcome->Get< long >() << " primes" << std::endl;
    }
    else
      std::cout << "Task " << Outcome->TaskID() << " failed with "
                << Outcome->GetErrorKind() << std::endl;

  std::cout << std::endl
            << "Submitted " << NumberOfTasks << " tasks: " << Accepted
            << " accepted, " << Rejected << " refused, " << Succeeded
            << " succeeded, " << Guardian.RestartCount( Pool.Name() )
            << " restarts" << std::endl;

  Guardian.Stop();
  Pool.Shutdown();

  return EXIT_SUCCESS;
}
