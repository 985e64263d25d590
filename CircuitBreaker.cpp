/*==============================================================================
Circuit Breaker

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <sstream>                   // Error messages
#include <stdexcept>                 // Standard exceptions

#include "Utility/ConsoleOutput.hpp"
#include "CircuitBreaker.hpp"

namespace Taskforce
{

std::string ToString( CircuitBreaker::State TheState )
{
  switch ( TheState )
  {
    case CircuitBreaker::State::Closed:   return "closed";
    case CircuitBreaker::State::Open:     return "open";
    case CircuitBreaker::State::HalfOpen: return "half open";
  }

  return "unknown";
}

CircuitBreaker::CircuitBreaker( const Parameters & TheSettings,
                                ClockFunction TheClock,
                                const std::string & TheName )
: Settings( TheSettings ), Now( std::move( TheClock ) ), BreakerName( TheName ),
  Guard(), Current( State::Closed ), Failures(), LastFailure(),
  ProbeSuccesses( 0 ), ProbeInFlight(), Epoch( 0 ), Admissions( 0 )
{
  if ( Settings.FailureThreshold == 0 || Settings.RequiredProbeSuccesses == 0 )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << BreakerName << " needs a failure threshold and a number of "
                 << "probe successes larger than zero, given "
                 << Settings.FailureThreshold << " and "
                 << Settings.RequiredProbeSuccesses;

    throw std::invalid_argument( LocatedMessage( ErrorMessage.str(),
                                 std::source_location::current() ) );
  }

  if ( !Now )
    throw std::invalid_argument( LocatedMessage(
      BreakerName + " has no clock", std::source_location::current() ) );
}

// -----------------------------------------------------------------------------
// State changes
// -----------------------------------------------------------------------------

void CircuitBreaker::ChangeState( State NewState )
{
  ConsoleOutput( ConsoleOutput::Severity::Information, BreakerName )
    << ToString( Current ) << " -> " << ToString( NewState ) << std::endl;

  Current        = NewState;
  ProbeSuccesses = 0;
  ProbeInFlight.reset();
  Epoch++;

  if ( NewState != State::Open )
    Failures.clear();
}

// The open timeout is measured from the last failure, and failures that have
// left the observation window no longer count towards the threshold.

void CircuitBreaker::Refresh( void )
{
  Clock::time_point Time = Now();

  if ( Current == State::Open && Time - LastFailure > Settings.OpenTimeout )
    ChangeState( State::HalfOpen );

  if ( Current == State::Closed && Settings.ObservationWindow )
    while ( !Failures.empty() &&
            Time - Failures.front() > *Settings.ObservationWindow )
      Failures.pop_front();
}

// -----------------------------------------------------------------------------
// Admission
// -----------------------------------------------------------------------------

CircuitBreaker::Ticket CircuitBreaker::Allow( void )
{
  std::lock_guard< std::mutex > Lock( Guard );

  Refresh();

  std::uint64_t Number = ++Admissions;

  switch ( Current )
  {
    case State::Closed:
      return Ticket( true, Epoch, Number );
    case State::Open:
      break;
    case State::HalfOpen:
      if ( ProbeInFlight )
        break;

      ProbeInFlight = Number;
      return Ticket( true, Epoch, Number );
  }

  return Ticket( false, Epoch, Number );
}

CircuitBreaker::Ticket CircuitBreaker::Admit( void )
{
  Ticket Admission = Allow();

  if ( !Admission )
    throw CircuitOpen( BreakerName + " does not admit requests" );

  return Admission;
}

// -----------------------------------------------------------------------------
// Outcomes
// -----------------------------------------------------------------------------
//
// An outcome with a ticket from an earlier epoch belongs to a request admitted
// before the last state change. A stale failure arriving while the breaker is
// open extends the open period, and all other stale outcomes are ignored.

void CircuitBreaker::RecordSuccess( const Ticket & Admission )
{
  std::lock_guard< std::mutex > Lock( Guard );

  Refresh();

  if ( !Admission.Admitted || Admission.Epoch != Epoch )
    return;

  switch ( Current )
  {
    case State::Closed:
      Failures.clear();
      break;
    case State::Open:
      break;
    case State::HalfOpen:
      if ( ProbeInFlight != Admission.Number )
        break;

      ProbeInFlight.reset();

      if ( ++ProbeSuccesses >= Settings.RequiredProbeSuccesses )
        ChangeState( State::Closed );
      break;
  }
}

void CircuitBreaker::RecordFailure( const Ticket & Admission )
{
  std::lock_guard< std::mutex > Lock( Guard );

  Refresh();

  if ( !Admission.Admitted )
    return;

  if ( Admission.Epoch != Epoch )
  {
    if ( Current == State::Open )
      LastFailure = Now();

    return;
  }

  switch ( Current )
  {
    case State::Closed:
      LastFailure = Now();
      Failures.push_back( LastFailure );

      if ( Failures.size() >= Settings.FailureThreshold )
        ChangeState( State::Open );
      break;
    case State::Open:
      break;
    case State::HalfOpen:
      if ( ProbeInFlight != Admission.Number )
        break;

      LastFailure = Now();
      ChangeState( State::Open );
      break;
  }
}

CircuitBreaker::State CircuitBreaker::GetState( void )
{
  std::lock_guard< std::mutex > Lock( Guard );

  Refresh();
  return Current;
}

}  // Name space Taskforce
