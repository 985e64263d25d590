/*==============================================================================
Priority Scheduler

The priority scheduler is the ordering discipline of a worker's mailbox when
tasks should not simply be served in order of arrival. Tasks are ordered on
their priority, highest first, and tasks of equal priority are ordered on
their arrival, first in first out. The arrival is recorded as a sequence number
assigned by the scheduler when the task is enqueued, so the order is fully
determined by the order of the enqueue operations. Two tasks of the same
priority can therefore never overtake each other, and the same submissions
will always be executed in the same order.

The scheduler is not thread safe. It is owned by the mailbox and only used
under the mailbox's lock.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_PRIORITY_SCHEDULER
#define TASKFORCE_PRIORITY_SCHEDULER

#include <queue>                     // The priority queue
#include <vector>                    // The queue's container
#include <cstdint>                   // Sequence numbers

#include "Task.hpp"

namespace Taskforce
{

class PriorityScheduler
{
public:

  using SequenceNumber = std::uint64_t;

private:

  class Entry
  {
  public:

    TaskPointer    TheTask;
    SequenceNumber Arrival;

    // The standard priority queue puts the largest element on top, and an
    // entry is therefore 'less' than another if it should be served later.

    inline bool operator < ( const Entry & Other ) const
    {
      if ( TheTask->Level != Other.TheTask->Level )
        return TheTask->Level < Other.TheTask->Level;
      else
        return Arrival > Other.Arrival;
    }
  };

  std::priority_queue< Entry, std::vector< Entry > > Pending;
  SequenceNumber NextArrival;

public:

  void        Enqueue( const TaskPointer & NewTask );
  TaskPointer Dequeue( void );

  // The first task is returned without removing it. Both this and the dequeue
  // function will throw a logic error if there are no tasks.

  const TaskPointer & Front( void ) const;

  inline std::size_t Size( void ) const
  { return Pending.size(); }

  inline bool Empty( void ) const
  { return Pending.empty(); }

  // Removing all tasks returns them in the order they would have been
  // dequeued.

  std::vector< TaskPointer > Clear( void );

  PriorityScheduler( void )
  : Pending(), NextArrival( 0 )
  {}
};

}      // Name space Taskforce
#endif // TASKFORCE_PRIORITY_SCHEDULER
