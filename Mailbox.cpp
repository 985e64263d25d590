/*==============================================================================
Mailbox

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <sstream>                   // Error messages

#include "Errors.hpp"
#include "Mailbox.hpp"

namespace Taskforce
{

Mailbox::Mailbox( const Parameters & TheSettings, const std::string & TheOwner )
: Settings( TheSettings ), Owner( TheOwner ),
  QueueGuard(), NewMessage(), MessageDone(), SpaceAvailable(),
  Prioritised(), Arrivals(),
  Accepting( true ), Suspended( false ), StopRequested( false ),
  ShutdownRequested( false ), InFlight( false )
{}

// -----------------------------------------------------------------------------
// Queue access
// -----------------------------------------------------------------------------
//
// These functions assume that the lock is already held, and they simply hide
// which of the two queues is in use.

std::size_t Mailbox::Pending( void ) const
{
  if ( Settings.Order == Ordering::Priority )
    return Prioritised.Size();
  else
    return Arrivals.size();
}

TaskPointer Mailbox::TakeFirst( void )
{
  if ( Settings.Order == Ordering::Priority )
    return Prioritised.Dequeue();

  TaskPointer First( Arrivals.front() );
  Arrivals.pop_front();
  return First;
}

std::vector< TaskPointer > Mailbox::TakeAll( void )
{
  if ( Settings.Order == Ordering::Priority )
    return Prioritised.Clear();

  std::vector< TaskPointer > Removed( Arrivals.begin(), Arrivals.end() );
  Arrivals.clear();
  return Removed;
}

// -----------------------------------------------------------------------------
// Storing tasks
// -----------------------------------------------------------------------------
//
// A blocked sender must re-check that the mailbox is still accepting when it
// wakes up because the wake up could be caused by a stop request.

void Mailbox::StoreMessage( const TaskPointer & TheTask )
{
  std::unique_lock< std::mutex > QueueLock( QueueGuard );

  if ( !Accepting )
    throw WorkerTerminated( Owner + " does not accept task "
                            + std::to_string( TheTask->ID ) );

  if ( Settings.Capacity > 0 && Pending() >= Settings.Capacity )
  {
    if ( Settings.WhenFull == FullPolicy::Fail )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << "The mailbox of " << Owner << " is full with "
                   << Settings.Capacity << " tasks, task " << TheTask->ID
                   << " is rejected";

      throw MailboxFull( ErrorMessage.str() );
    }

    SpaceAvailable.wait( QueueLock, [this]{
      return !Accepting || Pending() < Settings.Capacity; });

    if ( !Accepting )
      throw WorkerTerminated( Owner + " terminated while task "
                              + std::to_string( TheTask->ID )
                              + " was waiting for space in the mailbox" );
  }

  if ( Settings.Order == Ordering::Priority )
    Prioritised.Enqueue( TheTask );
  else
    Arrivals.push_back( TheTask );

  NewMessage.notify_all();
}

// -----------------------------------------------------------------------------
// Delivering tasks
// -----------------------------------------------------------------------------
//
// The order of the tests matter: a stop request bypasses everything, then
// tasks are delivered unless the mailbox is suspended, and only when all tasks
// have been delivered and completed will a shutdown report the drained mailbox.

Mailbox::Delivery Mailbox::NextMessage( void )
{
  std::unique_lock< std::mutex > QueueLock( QueueGuard );

  NewMessage.wait( QueueLock, [this]{
    return StopRequested || ( !Suspended && Pending() > 0 ) ||
           ( ShutdownRequested && Pending() == 0 ); });

  if ( StopRequested )
    return Delivery{ Signal::Stop, nullptr };

  if ( !Suspended && Pending() > 0 )
  {
    TaskPointer Next( TakeFirst() );

    InFlight = true;
    SpaceAvailable.notify_one();

    return Delivery{ Signal::Deliver, Next };
  }

  return Delivery{ Signal::Drained, nullptr };
}

void Mailbox::MessageCompleted( void )
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );

  InFlight = false;
  MessageDone.notify_all();
}

std::size_t Mailbox::Size( void ) const
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );
  return Pending();
}

std::size_t Mailbox::Depth( void ) const
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );
  return Pending() + ( InFlight ? 1 : 0 );
}

bool Mailbox::IsAccepting( void ) const
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );
  return Accepting;
}

// -----------------------------------------------------------------------------
// Control
// -----------------------------------------------------------------------------

bool Mailbox::Suspend( void )
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );

  if ( Suspended ) return false;

  Suspended = true;
  return true;
}

bool Mailbox::Release( void )
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );

  if ( !Suspended ) return false;

  Suspended = false;
  NewMessage.notify_all();
  return true;
}

std::vector< TaskPointer > Mailbox::RequestStop( void )
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );

  Accepting     = false;
  StopRequested = true;

  std::vector< TaskPointer > Removed( TakeAll() );

  NewMessage.notify_all();
  SpaceAvailable.notify_all();
  MessageDone.notify_all();

  return Removed;
}

void Mailbox::RequestShutdown( void )
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );

  Accepting         = false;
  ShutdownRequested = true;
  Suspended         = false;

  NewMessage.notify_all();
  SpaceAvailable.notify_all();
}

void Mailbox::Refuse( void )
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );

  Accepting = false;
  InFlight  = false;

  SpaceAvailable.notify_all();
  MessageDone.notify_all();
}

void Mailbox::Reopen( void )
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );

  Accepting         = true;
  Suspended         = false;
  StopRequested     = false;
  ShutdownRequested = false;
  InFlight          = false;
}

std::vector< TaskPointer > Mailbox::Drain( void )
{
  std::lock_guard< std::mutex > QueueLock( QueueGuard );

  Accepting = false;

  std::vector< TaskPointer > Removed( TakeAll() );

  SpaceAvailable.notify_all();
  MessageDone.notify_all();

  return Removed;
}

// Since the condition is tested before the wait, it is safe to wait even if
// the mailbox is already empty.

void Mailbox::WaitUntilEmpty( void )
{
  std::unique_lock< std::mutex > QueueLock( QueueGuard );

  MessageDone.wait( QueueLock, [this]{
    return StopRequested || ( Pending() == 0 && !InFlight ); });
}

}  // Name space Taskforce
