/*==============================================================================
Circuit Breaker

The circuit breaker protects a service, typically a worker pool, from being
flooded with requests while it is failing. It has three states:

Closed:   Requests are admitted and failures are counted. A success resets the
          count, and when the count of consecutive failures reaches the
          threshold the breaker opens. If an observation window is given,
          failures older than the window are forgotten.
Open:     No requests are admitted until the open timeout has passed since the
          last failure, and then the breaker becomes half open.
HalfOpen: One probe request is admitted at the time. When the required number
          of probes have succeeded in a row the breaker closes, and a single
          failing probe opens it again.

Every admission returns a ticket, and the outcome of the request is recorded
with its ticket. The breaker counts the state changes, and an outcome of a
request admitted before the last state change is stale: a stale success is
ignored, and a stale failure only extends the open period if the breaker is
open. In the half open state only the ticket of the probe in flight can count
a probe success or reopen the breaker, so a late outcome of a request admitted
while the breaker was closed cannot release the probe.

The transition from Open to HalfOpen is made when the state is inspected, so
the breaker has no thread of its own. The breaker reads time from a clock
function that defaults to the steady clock, and tests can give a clock they
control.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_CIRCUIT_BREAKER
#define TASKFORCE_CIRCUIT_BREAKER

#include <chrono>                    // Time
#include <cstdint>                   // Ticket numbers
#include <functional>                // The clock function
#include <mutex>                     // Protecting the state
#include <deque>                     // Failure times
#include <optional>                  // Observation window
#include <string>                    // Breaker name
#include <type_traits>               // Guarded calls

#include "Errors.hpp"

namespace Taskforce
{

class CircuitBreaker
{
public:

  enum class State
  {
    Closed,
    Open,
    HalfOpen
  };

  using Clock         = std::chrono::steady_clock;
  using ClockFunction = std::function< Clock::time_point( void ) >;

  class Parameters
  {
  public:

    unsigned int                     FailureThreshold;
    Clock::duration                  OpenTimeout;
    unsigned int                     RequiredProbeSuccesses;
    std::optional< Clock::duration > ObservationWindow;

    Parameters( unsigned int TheThreshold = 5,
                Clock::duration TheTimeout = std::chrono::seconds( 1 ),
                unsigned int TheProbes = 1,
                std::optional< Clock::duration > TheWindow = std::nullopt )
    : FailureThreshold( TheThreshold ), OpenTimeout( TheTimeout ),
      RequiredProbeSuccesses( TheProbes ), ObservationWindow( TheWindow )
    {}
  };

  // The ticket is opaque to everyone but the breaker issuing it. It converts
  // to true if the request was admitted.

  class Ticket
  {
  private:

    bool          Admitted;
    std::uint64_t Epoch, Number;

    Ticket( bool IsAdmitted, std::uint64_t TheEpoch, std::uint64_t TheNumber )
    : Admitted( IsAdmitted ), Epoch( TheEpoch ), Number( TheNumber )
    {}

    friend class CircuitBreaker;

  public:

    explicit operator bool ( void ) const
    { return Admitted; }

    Ticket( const Ticket & Other ) = default;
    Ticket & operator = ( const Ticket & Other ) = default;
  };

private:

  const Parameters    Settings;
  const ClockFunction Now;
  const std::string   BreakerName;

  mutable std::mutex               Guard;
  State                            Current;
  std::deque< Clock::time_point >  Failures;
  Clock::time_point                LastFailure;
  unsigned int                     ProbeSuccesses;
  std::optional< std::uint64_t >   ProbeInFlight;
  std::uint64_t                    Epoch, Admissions;

  // Must be called with the lock held

  void Refresh( void );
  void ChangeState( State NewState );

public:

  // Allow returns an admitted ticket if a request may proceed. In the half
  // open state this reserves the probe, and the outcome must be recorded with
  // the ticket to release it. Admit throws Circuit Open instead of returning
  // a ticket that is not admitted.

  Ticket Allow( void );
  Ticket Admit( void );

  void RecordSuccess( const Ticket & Admission );
  void RecordFailure( const Ticket & Admission );

  State GetState( void );

  inline const std::string & Name( void ) const
  { return BreakerName; }

  // A guarded call admits the request, runs the function and records the
  // outcome. An exception from the function is recorded as a failure and
  // passed on to the caller.

  template< class FunctionType >
  auto Call( FunctionType && TheFunction )
  {
    Ticket Admission = Admit();

    try
    {
      if constexpr ( std::is_void_v< std::invoke_result_t< FunctionType > > )
      {
        TheFunction();
        RecordSuccess( Admission );
      }
      else
      {
        auto Value = TheFunction();
        RecordSuccess( Admission );
        return Value;
      }
    }
    catch ( ... )
    {
      RecordFailure( Admission );
      throw;
    }
  }

  CircuitBreaker( const Parameters & TheSettings = Parameters(),
                  ClockFunction TheClock = &Clock::now,
                  const std::string & TheName = "CircuitBreaker" );

  CircuitBreaker( const CircuitBreaker & Other ) = delete;
  CircuitBreaker & operator = ( const CircuitBreaker & Other ) = delete;
};

std::string ToString( CircuitBreaker::State TheState );

}      // Name space Taskforce
#endif // TASKFORCE_CIRCUIT_BREAKER
