/*==============================================================================
Supervisor

The supervisor observes the lifecycle events of the entities it manages, and
restarts an entity that has exited because of a fault. The entities can be
workers, worker pools, or other supervisors, and they are managed by name: the
supervisor keeps an explicit map from the entity names to the entities and
their restart records.

The supervisor has its own thread and its own event queue. The entities only
store their events in the queue, and the restart records are only changed by
the supervisor's thread when it handles the events. The restarts are not done
immediately, but scheduled after a back off delay in a time ordered queue, and
the supervisor thread waits for the first scheduled restart or the next event,
whichever comes first.

The number of restarts is bounded. The restart times of each entity are
remembered within a rolling window, and an entity failing more often than the
maximum number of restarts within the window is given up: it is abandoned,
registered as permanently failed, and the failure is reported to the
supervisor's own observers with a Restart Budget Exceeded error followed by a
fault exit. A parent supervisor managing this supervisor will then restart it,
which resets the restart records and restarts the entities it had given up.

The delay before a restart depends on the number k of restarts already done
within the window, and the back off strategy:

Constant:    the base delay
Linear:      the base delay times (k + 1)
Exponential: the base delay times 2^k

and it is never longer than the maximum delay.

Exits that have been requested never cause a restart, and error events for
failed tasks are only logged.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_SUPERVISOR
#define TASKFORCE_SUPERVISOR

#include <chrono>                    // Time and delays
#include <deque>                     // Event queue and restart times
#include <map>                       // Managed entities and restart schedule
#include <mutex>                     // Protecting the queues
#include <condition_variable>        // Waiting for events
#include <thread>                    // The supervisor thread
#include <string>                    // Entity names
#include <vector>                    // Reports

#include "Lifecycle.hpp"

namespace Taskforce
{

class Supervisor : public SupervisedEntity, public LifecycleObserver
{
public:

  using Clock = std::chrono::steady_clock;

  enum class Backoff
  {
    Constant,
    Linear,
    Exponential
  };

  class Parameters
  {
  public:

    unsigned int    MaxRestarts;
    Clock::duration Window,
                    BaseDelay,
                    MaxDelay;
    Backoff         Strategy;

    Parameters( unsigned int TheMaxRestarts = 3,
                Clock::duration TheWindow = std::chrono::seconds( 60 ),
                Backoff TheStrategy = Backoff::Exponential,
                Clock::duration TheBaseDelay = std::chrono::milliseconds( 100 ),
                Clock::duration TheMaxDelay = std::chrono::seconds( 10 ) )
    : MaxRestarts( TheMaxRestarts ), Window( TheWindow ),
      BaseDelay( TheBaseDelay ), MaxDelay( TheMaxDelay ),
      Strategy( TheStrategy )
    {}
  };

  // The delay before a restart given the restarts already done in the window

  static Clock::duration RestartDelay( const Parameters & Policy,
                                       unsigned int PriorRestarts );

private:

  const std::string SupervisorName;
  const Parameters  Policy;

  class Record
  {
  public:

    SupervisedEntity *              Entity;
    std::deque< Clock::time_point > Restarts;
    unsigned int                    TotalRestarts;
    bool                            PermanentlyFailed;

    Record( SupervisedEntity * TheEntity )
    : Entity( TheEntity ), Restarts(), TotalRestarts( 0 ),
      PermanentlyFailed( false )
    {}
  };

  std::mutex                                  QueueGuard;
  std::condition_variable                     QueueChanged;
  std::deque< LifecycleEvent >                Events;
  std::multimap< Clock::time_point, std::string > ScheduledRestarts;
  std::map< std::string, Record >             Managed;
  bool                                        Running;

  std::thread EventLoop;

  // The supervisor thread processes events and performs the scheduled
  // restarts. None of the handlers hold the lock while calling an entity.

  void ProcessEvents( void );
  void HandleEvent( const LifecycleEvent & TheEvent );
  void HandleFault( const std::string & EntityName,
                    const std::string & Details );
  void PerformRestart( const std::string & EntityName );

public:

  // Managing an entity subscribes the supervisor to the entity's events. The
  // entity must outlive its management, and the names of the managed entities
  // must be unique.

  void Manage( SupervisedEntity & TheEntity );
  void Release( const std::string & EntityName );

  std::vector< std::string > PermanentFailures( void );
  unsigned int RestartCount( const std::string & EntityName );
  bool IsManaged( const std::string & EntityName );

  // Stopping the supervisor ends its thread and releases all the entities.
  // Pending restarts are cancelled.

  void Stop( void );

  virtual void Notify( const LifecycleEvent & TheEvent ) override;

  virtual std::string Name( void ) const override;
  virtual void Restart( void ) override;
  virtual void Abandon( void ) override;

  Supervisor( const std::string & TheName,
              const Parameters & ThePolicy = Parameters() );

  Supervisor( const Supervisor & Other ) = delete;
  Supervisor & operator = ( const Supervisor & Other ) = delete;

  virtual ~Supervisor();
};

std::string ToString( Supervisor::Backoff Strategy );

}      // Name space Taskforce
#endif // TASKFORCE_SUPERVISOR
