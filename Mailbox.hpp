/*==============================================================================
Mailbox

Each worker has a mailbox where other threads place the tasks for the worker,
and the worker consumes the tasks one by one from its dispatcher thread. The
mailbox is thus the only memory resource shared between the worker and the
threads submitting tasks, and all access is serialised by the mailbox's lock.
The mailbox supports the notification of three events: the arrival of a new
task for the waiting dispatcher, the completion of a task for threads waiting
for the mailbox to drain, and freed capacity for senders blocked on a full
bounded mailbox.

The order of the pending tasks is either the order of arrival, or the order
given by the priority scheduler. A bounded mailbox holds at most the given
capacity of pending tasks, and a task sent to a full mailbox will either block
the sender until there is space or fail with a Mailbox Full error, depending
on the policy chosen when the mailbox was created.

The dispatcher does not only receive tasks. A stop request is a control
message that is delivered ahead of any pending task, and a shutdown request
makes the mailbox deliver the drained signal once the last pending task has
been handed out. A suspended mailbox does not hand out tasks, but it will still
deliver a stop request.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_MAILBOX
#define TASKFORCE_MAILBOX

#include <mutex>                     // To protect the queue
#include <condition_variable>        // To synchronise threads
#include <deque>                     // Arrival order
#include <vector>                    // Drained tasks
#include <string>                    // Owner name

#include "Task.hpp"
#include "PriorityScheduler.hpp"

namespace Taskforce
{

class Mailbox
{
public:

  enum class Ordering
  {
    Arrival,
    Priority
  };

  enum class FullPolicy
  {
    Block,
    Fail
  };

  // A capacity of zero means that the mailbox is unbounded

  class Parameters
  {
  public:

    std::size_t Capacity;
    FullPolicy  WhenFull;
    Ordering    Order;

    Parameters( std::size_t TheCapacity = 0,
                FullPolicy  ThePolicy   = FullPolicy::Block,
                Ordering    TheOrder    = Ordering::Priority )
    : Capacity( TheCapacity ), WhenFull( ThePolicy ), Order( TheOrder )
    {}
  };

  // The dispatcher receives either a task, the request to stop, or the signal
  // that the mailbox has been drained after a shutdown request.

  enum class Signal
  {
    Deliver,
    Stop,
    Drained
  };

  class Delivery
  {
  public:

    Signal      What;
    TaskPointer TheTask;
  };

private:

  const Parameters  Settings;
  const std::string Owner;

  mutable std::mutex      QueueGuard;
  std::condition_variable NewMessage, MessageDone, SpaceAvailable;

  PriorityScheduler         Prioritised;
  std::deque< TaskPointer > Arrivals;

  bool Accepting, Suspended, StopRequested, ShutdownRequested, InFlight;

  // Utility functions that must be called with the lock held

  std::size_t Pending( void ) const;
  TaskPointer TakeFirst( void );
  std::vector< TaskPointer > TakeAll( void );

public:

  // Storing a task throws Worker Terminated if the mailbox no longer accepts
  // tasks, also if this happens while the sender is blocked on a full
  // mailbox, and Mailbox Full if the mailbox is full and the policy is to
  // fail.

  void StoreMessage( const TaskPointer & TheTask );

  // The dispatcher blocks on the next message until there is something to
  // deliver. When it has processed a delivered task it must tell the mailbox
  // that the task is completed.

  Delivery NextMessage( void );
  void     MessageCompleted( void );

  // The size is the number of pending tasks, and the depth includes the task
  // currently being processed.

  std::size_t Size( void ) const;
  std::size_t Depth( void ) const;
  bool        IsAccepting( void ) const;

  // Suspension stops the delivery of tasks. The functions return false if the
  // mailbox was already in the requested state.

  bool Suspend( void );
  bool Release( void );

  // A stop request closes the mailbox, removes all pending tasks and returns
  // them, and wakes the dispatcher and any blocked sender. A shutdown request
  // closes the mailbox for new tasks and lifts any suspension so that the
  // pending tasks are delivered before the drained signal.

  std::vector< TaskPointer > RequestStop( void );
  void RequestShutdown( void );

  // A worker that has failed refuses new tasks but keeps the pending ones so
  // that they can be processed if the worker is restarted, in which case the
  // mailbox is reopened. If the worker is given up the pending tasks are
  // drained.

  void Refuse( void );
  void Reopen( void );
  std::vector< TaskPointer > Drain( void );

  // Blocks until there are no pending tasks and no task in progress. This
  // cannot be called from the dispatcher as it would then never return.

  void WaitUntilEmpty( void );

  Mailbox( const Parameters & TheSettings = Parameters(),
           const std::string & TheOwner = std::string() );

  Mailbox( const Mailbox & Other ) = delete;
  Mailbox & operator = ( const Mailbox & Other ) = delete;
};

}      // Name space Taskforce
#endif // TASKFORCE_MAILBOX
