/*==============================================================================
Priority Scheduler Test

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <memory>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "PriorityScheduler.hpp"

namespace Taskforce
{
namespace
{

TaskPointer Prioritised( Task::Priority Level )
{
  return std::make_shared< const Task >(
    []( const std::any & ){ return std::any(); }, std::any(), Level );
}

std::vector< Task::Priority > Levels( const std::vector< TaskPointer > & Tasks )
{
  std::vector< Task::Priority > Result;

  for ( const TaskPointer & TheTask : Tasks )
    Result.push_back( TheTask->Level );

  return Result;
}

TEST( PrioritySchedulerTest, DequeuesHighestPriorityFirst )
{
  PriorityScheduler Scheduler;

  Scheduler.Enqueue( Prioritised( 1 ) );
  Scheduler.Enqueue( Prioritised( 7 ) );
  Scheduler.Enqueue( Prioritised( -3 ) );
  Scheduler.Enqueue( Prioritised( 4 ) );

  EXPECT_EQ( Scheduler.Size(), 4u );
  EXPECT_EQ( Scheduler.Front()->Level, 7 );
  EXPECT_EQ( Scheduler.Dequeue()->Level, 7 );
  EXPECT_EQ( Scheduler.Dequeue()->Level, 4 );
  EXPECT_EQ( Scheduler.Dequeue()->Level, 1 );
  EXPECT_EQ( Scheduler.Dequeue()->Level, -3 );
  EXPECT_TRUE( Scheduler.Empty() );
}

TEST( PrioritySchedulerTest, EqualPrioritiesAreServedInArrivalOrder )
{
  PriorityScheduler Scheduler;
  std::vector< TaskPointer > Submitted;

  for ( int i = 0; i < 20; i++ )
  {
    Submitted.push_back( Prioritised( i % 2 ) );
    Scheduler.Enqueue( Submitted.back() );
  }

  std::vector< TaskIdentifier > Expected;

  for ( int Level : { 1, 0 } )
    for ( const TaskPointer & TheTask : Submitted )
      if ( TheTask->Level == Level )
        Expected.push_back( TheTask->ID );

  std::vector< TaskIdentifier > Served;

  while ( !Scheduler.Empty() )
    Served.push_back( Scheduler.Dequeue()->ID );

  EXPECT_EQ( Served, Expected );
}

TEST( PrioritySchedulerTest, ClearReturnsTasksInDequeueOrder )
{
  PriorityScheduler Scheduler;

  for ( Task::Priority Level : { 2, 5, 2, 9, 0 } )
    Scheduler.Enqueue( Prioritised( Level ) );

  std::vector< TaskPointer > Removed = Scheduler.Clear();

  EXPECT_EQ( Levels( Removed ),
             ( std::vector< Task::Priority >{ 9, 5, 2, 2, 0 } ) );
  EXPECT_TRUE( Removed[ 2 ]->ID < Removed[ 3 ]->ID );
  EXPECT_TRUE( Scheduler.Empty() );
}

TEST( PrioritySchedulerTest, EmptySchedulerRefusesToDequeue )
{
  PriorityScheduler Scheduler;

  EXPECT_THROW( Scheduler.Dequeue(), std::logic_error );
  EXPECT_THROW( Scheduler.Front(), std::logic_error );
  EXPECT_THROW( Scheduler.Enqueue( nullptr ), std::invalid_argument );
}

}  // anonymous name space
}  // Name space Taskforce
