/*==============================================================================
Lifecycle

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <algorithm>                 // Finding observers

#include "Lifecycle.hpp"

namespace Taskforce
{

// -----------------------------------------------------------------------------
// Events
// -----------------------------------------------------------------------------

LifecycleEvent LifecycleEvent::Started( const std::string & TheSource )
{
  LifecycleEvent NewEvent;

  NewEvent.What   = Kind::Started;
  NewEvent.Source = TheSource;

  return NewEvent;
}

LifecycleEvent LifecycleEvent::Completed( const std::string & TheSource,
                                          TaskIdentifier TheTask )
{
  LifecycleEvent NewEvent;

  NewEvent.What   = Kind::Completed;
  NewEvent.Source = TheSource;
  NewEvent.TaskID = TheTask;

  return NewEvent;
}

LifecycleEvent LifecycleEvent::Failed( const std::string & TheSource,
                                       ErrorKind TheError,
                                       const std::string & TheDetails )
{
  LifecycleEvent NewEvent;

  NewEvent.What    = Kind::Error;
  NewEvent.Source  = TheSource;
  NewEvent.Error   = TheError;
  NewEvent.Details = TheDetails;

  return NewEvent;
}

LifecycleEvent LifecycleEvent::Exited( const std::string & TheSource,
                                       ExitReason TheReason,
                                       const std::string & TheDetails )
{
  LifecycleEvent NewEvent;

  NewEvent.What    = Kind::Exited;
  NewEvent.Source  = TheSource;
  NewEvent.Reason  = TheReason;
  NewEvent.Details = TheDetails;

  return NewEvent;
}

std::string ToString( LifecycleEvent::Kind What )
{
  switch ( What )
  {
    case LifecycleEvent::Kind::Started:   return "started";
    case LifecycleEvent::Kind::Completed: return "completed";
    case LifecycleEvent::Kind::Error:     return "error";
    case LifecycleEvent::Kind::Exited:    return "exited";
  }

  return "unknown";
}

std::string ToString( LifecycleEvent::ExitReason Reason )
{
  if ( Reason == LifecycleEvent::ExitReason::Fault )
    return "fault";
  else
    return "requested";
}

std::ostream & operator << ( std::ostream & Output,
                             const LifecycleEvent & TheEvent )
{
  Output << TheEvent.Source << " " << ToString( TheEvent.What );

  if ( TheEvent.WorkerID )
    Output << " worker " << *TheEvent.WorkerID;

  if ( TheEvent.TaskID )
    Output << " task " << *TheEvent.TaskID;

  if ( TheEvent.Error )
    Output << " " << *TheEvent.Error;

  if ( TheEvent.Reason )
    Output << " (" << ToString( *TheEvent.Reason ) << ")";

  if ( !TheEvent.Details.empty() )
    Output << ": " << TheEvent.Details;

  return Output;
}

// -----------------------------------------------------------------------------
// Subscriptions
// -----------------------------------------------------------------------------
//
// The same observer is only registered once.

void SupervisedEntity::Subscribe( LifecycleObserver & TheObserver )
{
  std::lock_guard< std::mutex > Lock( ObserverGuard );

  if ( std::find( Observers.begin(), Observers.end(), &TheObserver )
       == Observers.end() )
    Observers.push_back( &TheObserver );
}

void SupervisedEntity::Unsubscribe( LifecycleObserver & TheObserver )
{
  std::lock_guard< std::mutex > Lock( ObserverGuard );

  Observers.erase( std::remove( Observers.begin(), Observers.end(),
                                &TheObserver ),
                   Observers.end() );
}

void SupervisedEntity::Emit( const LifecycleEvent & TheEvent )
{
  std::lock_guard< std::mutex > Lock( ObserverGuard );

  for ( LifecycleObserver * TheObserver : Observers )
    TheObserver->Notify( TheEvent );
}

}  // Name space Taskforce
