/*==============================================================================
Test Utilities

The tests of the concurrent components need to hold computations at a given
point, to observe lifecycle events from other threads, and to control time.
The gate blocks computations until it is opened, the event recorder is a
lifecycle observer storing all events it receives, and the manual clock is a
clock function whose time only moves when the test advances it.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_TEST_UTILITIES
#define TASKFORCE_TEST_UTILITIES

#include <mutex>
#include <condition_variable>
#include <chrono>
#include <vector>
#include <functional>
#include <algorithm>

#include "Lifecycle.hpp"

namespace Taskforce::Test
{

constexpr auto Patience = std::chrono::seconds( 10 );

// -----------------------------------------------------------------------------
// Gate
// -----------------------------------------------------------------------------

class Gate
{
private:

  std::mutex              Guard;
  std::condition_variable Changed;
  bool                    Opened;
  unsigned int            Arrivals;

public:

  // Called by the computation, it blocks until the gate is opened

  void Pass( void )
  {
    std::unique_lock< std::mutex > Lock( Guard );

    Arrivals++;
    Changed.notify_all();
    Changed.wait( Lock, [this]{ return Opened; } );
  }

  void Open( void )
  {
    std::lock_guard< std::mutex > Lock( Guard );

    Opened = true;
    Changed.notify_all();
  }

  // Waits until the given number of computations have reached the gate

  bool WaitForArrivals( unsigned int Expected )
  {
    std::unique_lock< std::mutex > Lock( Guard );

    return Changed.wait_for( Lock, Patience,
                             [&]{ return Arrivals >= Expected; } );
  }

  Gate( void )
  : Guard(), Changed(), Opened( false ), Arrivals( 0 )
  {}
};

// -----------------------------------------------------------------------------
// Event recorder
// -----------------------------------------------------------------------------

class EventRecorder : public LifecycleObserver
{
private:

  mutable std::mutex              Guard;
  std::condition_variable         Arrived;
  std::vector< LifecycleEvent >   Events;

public:

  using Predicate = std::function< bool( const LifecycleEvent & ) >;

  virtual void Notify( const LifecycleEvent & TheEvent ) override
  {
    std::lock_guard< std::mutex > Lock( Guard );

    Events.push_back( TheEvent );
    Arrived.notify_all();
  }

  std::vector< LifecycleEvent > Recorded( void ) const
  {
    std::lock_guard< std::mutex > Lock( Guard );
    return Events;
  }

  std::size_t Count( const Predicate & Selected ) const
  {
    std::lock_guard< std::mutex > Lock( Guard );
    return std::count_if( Events.begin(), Events.end(), Selected );
  }

  bool WaitFor( const Predicate & Selected, std::size_t Expected = 1 )
  {
    std::unique_lock< std::mutex > Lock( Guard );

    return Arrived.wait_for( Lock, Patience, [&]{
      return static_cast< std::size_t >(
        std::count_if( Events.begin(), Events.end(), Selected ) ) >= Expected;
    });
  }
};

inline bool IsFault( const LifecycleEvent & TheEvent )
{ return TheEvent.IsFault(); }

inline bool IsCompletion( const LifecycleEvent & TheEvent )
{ return TheEvent.What == LifecycleEvent::Kind::Completed; }

inline EventRecorder::Predicate IsError( ErrorKind Kind )
{
  return [Kind]( const LifecycleEvent & TheEvent ){
    return TheEvent.What == LifecycleEvent::Kind::Error &&
           TheEvent.Error == Kind; };
}

// -----------------------------------------------------------------------------
// Manual clock
// -----------------------------------------------------------------------------
//
// The clock is shared with the component by reference, and the test must keep
// it alive as long as the component exists.

class ManualClock
{
private:

  std::chrono::steady_clock::time_point Now;

public:

  std::chrono::steady_clock::time_point operator() ( void ) const
  { return Now; }

  template< class Rep, class Period >
  void Advance( const std::chrono::duration< Rep, Period > & Step )
  { Now += Step; }

  std::function< std::chrono::steady_clock::time_point( void ) >
  Function( void ) const
  { return [this]{ return Now; }; }

  ManualClock( void )
  : Now( std::chrono::steady_clock::time_point() + std::chrono::hours( 1 ) )
  {}
};

}      // Name space Taskforce::Test
#endif // TASKFORCE_TEST_UTILITIES
