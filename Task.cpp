/*==============================================================================
Task

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <stdexcept>                 // Standard exceptions

#include "Task.hpp"

namespace Taskforce
{

std::string PayloadTypeName( const std::any & Value )
{
  if ( !Value.has_value() )
    return "nothing";

  return boost::core::demangle( Value.type().name() );
}

/*==============================================================================

 Result

==============================================================================*/

Result Result::Success( TaskIdentifier TheTask, std::any TheValue )
{
  return Result( TheTask, Outcome::Success, std::move( TheValue ),
                 std::nullopt, std::string() );
}

Result Result::Failure( TaskIdentifier TheTask, ErrorKind TheKind,
                        const std::string & TheMessage )
{
  return Result( TheTask, Outcome::Failure, std::any(), TheKind, TheMessage );
}

ErrorKind Result::GetErrorKind( void ) const
{
  if ( !Kind )
    throw std::logic_error( LocatedMessage(
      "The result of task " + std::to_string( ID ) + " is not a failure",
      std::source_location::current() ) );

  return *Kind;
}

const std::any & Result::GetValue( void ) const
{
  if ( Status == Outcome::Failure )
    Raise( *Kind, "Task " + std::to_string( ID ) + " failed: " + Message );

  return Value;
}

/*==============================================================================

 Task

==============================================================================*/

std::atomic< Task::Identifier > Task::TotalTasksCreated( 0 );

Task::Task( Computation TheComputation, std::any ThePayload,
            Priority ThePriority, std::shared_ptr< ReplyTarget > TheReplyTarget )
: ID( GetNewID() ), Level( ThePriority ), Payload( std::move( ThePayload ) ),
  Function( std::move( TheComputation ) ), ReplyTo( std::move( TheReplyTarget ) )
{
  if ( !Function )
    throw std::invalid_argument( LocatedMessage(
      "Task " + std::to_string( ID ) + " has no computation",
      std::source_location::current() ) );
}

Task::Task( const Task & Other, std::shared_ptr< ReplyTarget > TheReplyTarget )
: ID( Other.ID ), Level( Other.Level ), Payload( Other.Payload ),
  Function( Other.Function ), ReplyTo( std::move( TheReplyTarget ) )
{}

/*==============================================================================

 Result handle

==============================================================================*/

ResultHandle::ResultHandle( TaskIdentifier TheTask,
                            std::shared_ptr< ReplyTarget > ForwardTo )
: ReplyTarget(), ID( TheTask ), Forward( std::move( ForwardTo ) ),
  Guard(), Arrived(), TheResult(), Answered( false ), Abandoned( false ),
  Cancelled( false )
{}

void ResultHandle::Store( const Result & NewResult )
{
  {
    std::lock_guard< std::mutex > Lock( Guard );

    if ( !Cancelled )
      TheResult.emplace( NewResult );
  }

  Arrived.notify_all();
}

void ResultHandle::MarkAbandoned( void )
{
  {
    std::lock_guard< std::mutex > Lock( Guard );
    Abandoned = true;
  }

  Arrived.notify_all();
}

// The forwarding is done outside of the lock since the forward target may be
// a callback doing arbitrary work. A waiting thread must be released even if
// the forward target throws, and the exception is then passed on to the
// worker delivering the result.

void ResultHandle::Deliver( const Result & NewResult )
{
  {
    std::lock_guard< std::mutex > Lock( Guard );

    if ( Answered ) return;

    Answered = true;
  }

  if ( Forward )
    try
    {
      Forward->Deliver( NewResult );
    }
    catch ( ... )
    {
      Store( NewResult );
      throw;
    }

  Store( NewResult );
}

void ResultHandle::Abandon( TaskIdentifier TheTask )
{
  {
    std::lock_guard< std::mutex > Lock( Guard );

    if ( Answered ) return;

    Answered = true;
  }

  if ( Forward )
    try
    {
      Forward->Abandon( TheTask );
    }
    catch ( ... )
    {
      MarkAbandoned();
      throw;
    }

  MarkAbandoned();
}

bool ResultHandle::Ready( void ) const
{
  std::lock_guard< std::mutex > Lock( Guard );
  return TheResult.has_value();
}

bool ResultHandle::IsAbandoned( void ) const
{
  std::lock_guard< std::mutex > Lock( Guard );
  return Abandoned;
}

void ResultHandle::Cancel( void )
{
  std::lock_guard< std::mutex > Lock( Guard );
  Cancelled = true;
}

Result ResultHandle::Wait( void )
{
  std::unique_lock< std::mutex > Lock( Guard );

  Arrived.wait( Lock, [this]{ return TheResult.has_value() || Abandoned; } );

  if ( !TheResult )
    throw WorkerTerminated( "Task " + std::to_string( ID )
                            + " was abandoned by a stopped worker" );

  return *TheResult;
}

/*==============================================================================

 Result collector

==============================================================================*/

void ResultCollector::Deliver( const Result & NewResult )
{
  {
    std::lock_guard< std::mutex > Lock( Guard );

    Pending.push_back( NewResult );
    Received.push_back( NewResult.TaskID() );
  }

  Arrived.notify_all();
}

void ResultCollector::Abandon( TaskIdentifier TheTask )
{
  std::lock_guard< std::mutex > Lock( Guard );
  AbandonedTasks.insert( TheTask );
}

std::size_t ResultCollector::Count( void ) const
{
  std::lock_guard< std::mutex > Lock( Guard );
  return Received.size();
}

std::vector< TaskIdentifier > ResultCollector::DeliveryOrder( void ) const
{
  std::lock_guard< std::mutex > Lock( Guard );
  return Received;
}

std::set< TaskIdentifier > ResultCollector::Abandoned( void ) const
{
  std::lock_guard< std::mutex > Lock( Guard );
  return AbandonedTasks;
}

}  // Name space Taskforce
