/*==============================================================================
Lifecycle

Failure information crosses component boundaries only as lifecycle events. An
entity that can be supervised, a worker, a pool, or a supervisor, emits an
event when it starts, when it completes a task, when a task or the entity
itself fails, and when it exits. The observers subscribing to these events are
typically supervisors, and an observer must not block in the notification
since it is called from the thread of the emitting entity. A supervisor just
stores the event in its own event queue and handles it later in its own thread.

A supervised entity must be able to restart after it has exited because of a
fault, and it must be possible to abandon it when the supervisor gives up
restarting it. Abandoning an entity must release everything waiting for it,
typically by answering the tasks it still holds with failure results.

The observers are kept as plain pointers. It is the responsibility of the
observer to unsubscribe before it is destroyed, and the subscription list is
locked while the observers are notified so that an observer is never called
after it has unsubscribed.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_LIFECYCLE
#define TASKFORCE_LIFECYCLE

#include <string>                    // Names and details
#include <optional>                  // Event attributes
#include <vector>                    // The observers
#include <mutex>                     // Protecting the observers
#include <ostream>                   // Printing events

#include "Errors.hpp"
#include "Task.hpp"

namespace Taskforce
{

/*==============================================================================

 Lifecycle event

==============================================================================*/

class LifecycleEvent
{
public:

  enum class Kind
  {
    Started,
    Completed,
    Error,
    Exited
  };

  // An exit is either requested by stopping or shutting down the entity, or
  // caused by a fault.

  enum class ExitReason
  {
    Requested,
    Fault
  };

  Kind                            What;
  std::string                     Source;
  std::optional< unsigned long >  WorkerID;
  std::optional< TaskIdentifier > TaskID;
  std::optional< ErrorKind >      Error;
  std::optional< ExitReason >     Reason;
  std::string                     Details;

  static LifecycleEvent Started( const std::string & TheSource );
  static LifecycleEvent Completed( const std::string & TheSource,
                                   TaskIdentifier TheTask );
  static LifecycleEvent Failed( const std::string & TheSource,
                                ErrorKind TheError,
                                const std::string & TheDetails );
  static LifecycleEvent Exited( const std::string & TheSource,
                                ExitReason TheReason,
                                const std::string & TheDetails = std::string() );

  inline bool IsFault( void ) const
  { return What == Kind::Exited && Reason == ExitReason::Fault; }
};

std::string ToString( LifecycleEvent::Kind What );
std::string ToString( LifecycleEvent::ExitReason Reason );
std::ostream & operator << ( std::ostream & Output,
                             const LifecycleEvent & TheEvent );

/*==============================================================================

 Observer and supervised entity

==============================================================================*/

class LifecycleObserver
{
public:

  virtual void Notify( const LifecycleEvent & TheEvent ) = 0;

  LifecycleObserver( void ) = default;
  virtual ~LifecycleObserver() = default;
};

class SupervisedEntity
{
private:

  std::mutex                        ObserverGuard;
  std::vector< LifecycleObserver * > Observers;

protected:

  void Emit( const LifecycleEvent & TheEvent );

public:

  void Subscribe( LifecycleObserver & TheObserver );
  void Unsubscribe( LifecycleObserver & TheObserver );

  virtual std::string Name( void ) const = 0;
  virtual void Restart( void ) = 0;
  virtual void Abandon( void ) = 0;

  SupervisedEntity( void ) = default;
  SupervisedEntity( const SupervisedEntity & Other ) = delete;
  SupervisedEntity & operator = ( const SupervisedEntity & Other ) = delete;

  virtual ~SupervisedEntity() = default;
};

}      // Name space Taskforce
#endif // TASKFORCE_LIFECYCLE
