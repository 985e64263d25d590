/*==============================================================================
Priority Scheduler

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <stdexcept>

#include "PriorityScheduler.hpp"

namespace Taskforce
{

void PriorityScheduler::Enqueue( const TaskPointer & NewTask )
{
  if ( !NewTask )
    throw std::invalid_argument( LocatedMessage(
      "Cannot schedule a null task", std::source_location::current() ) );

  Pending.push( Entry{ NewTask, NextArrival++ } );
}

const TaskPointer & PriorityScheduler::Front( void ) const
{
  if ( Pending.empty() )
    throw std::logic_error( LocatedMessage(
      "No task is scheduled", std::source_location::current() ) );

  return Pending.top().TheTask;
}

TaskPointer PriorityScheduler::Dequeue( void )
{
  TaskPointer First( Front() );

  Pending.pop();
  return First;
}

std::vector< TaskPointer > PriorityScheduler::Clear( void )
{
  std::vector< TaskPointer > Removed;

  Removed.reserve( Pending.size() );

  while ( !Pending.empty() )
    Removed.push_back( Dequeue() );

  return Removed;
}

}  // Name space Taskforce
