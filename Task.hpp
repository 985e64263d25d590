/*==============================================================================
Task

A task is the unit of work given to a worker. It combines a computation with
the input payload for this computation, a priority used by the worker's
mailbox to order pending tasks, and the reply target that will receive the
result of the computation. A task is immutable once it is constructed: all its
fields are constant, and a task is shared between the submitter and the
executing worker through a pointer to a constant task.

The runtime does not know the shape of the payloads or of the computed values.
Both are stored as standard 'any' objects and it is the application's
responsibility to match the computation to the payload. A typed task can be
created with the Make Task template that wraps a typed function in a
computation taking the payload as an 'any' value. If a payload or a value is
requested as another type than the one it holds, a Payload Type Error is
thrown naming both types.

Results are delivered to a reply target. The runtime offers three reply
targets: the Result Handle waiting for exactly one result, the Result Collector
receiving the results of many tasks in the order they complete, and the
Reply Callback invoking a function for each result. The callback runs in the
thread of the worker executing the task, and it should therefore do little
more than forwarding the result.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_TASK
#define TASKFORCE_TASK

#include <any>                       // Opaque payloads and values
#include <atomic>                    // Unique task identifiers
#include <chrono>                    // Time out on waits
#include <condition_variable>        // Waiting for results
#include <deque>                     // Collected results
#include <functional>                // Computations
#include <memory>                    // Shared pointers
#include <mutex>                     // Protecting the reply targets
#include <optional>                  // Results that may not arrive
#include <set>                       // Abandoned task identifiers
#include <string>                    // Messages
#include <type_traits>               // Typed computations
#include <typeinfo>                  // Payload type names
#include <utility>                   // Moving values
#include <vector>                    // Result snapshots

#include <boost/core/demangle.hpp>   // Readable type names

#include "Errors.hpp"

namespace Taskforce
{

using TaskIdentifier = unsigned long;

// The type names of the 'any' values are not readable in their raw form, and
// they are demangled when reported in errors.

std::string PayloadTypeName( const std::any & Value );

template< class Type >
inline std::string PayloadTypeName( void )
{ return boost::core::demangle( typeid( Type ).name() ); }

/*==============================================================================

 Result

==============================================================================*/

class Result
{
public:

  enum class Outcome
  {
    Success,
    Failure
  };

private:

  TaskIdentifier            ID;
  Outcome                   Status;
  std::any                  Value;
  std::optional< ErrorKind > Kind;
  std::string               Message;

  Result( TaskIdentifier TheTask, Outcome TheStatus, std::any TheValue,
          std::optional< ErrorKind > TheKind, std::string TheMessage )
  : ID( TheTask ), Status( TheStatus ), Value( std::move( TheValue ) ),
    Kind( TheKind ), Message( std::move( TheMessage ) )
  {}

public:

  static Result Success( TaskIdentifier TheTask, std::any TheValue );
  static Result Failure( TaskIdentifier TheTask, ErrorKind TheKind,
                         const std::string & TheMessage );

  inline TaskIdentifier TaskID( void ) const
  { return ID; }

  inline Outcome GetOutcome( void ) const
  { return Status; }

  inline bool IsSuccess( void ) const
  { return Status == Outcome::Success; }

  inline const std::string & GetMessage( void ) const
  { return Message; }

  // The error kind is only defined for failures, and asking a successful
  // result for its error is a logic error.

  ErrorKind GetErrorKind( void ) const;

  // The value of a failed result does not exist, and requesting it will throw
  // the exception corresponding to the error kind of the failure.

  const std::any & GetValue( void ) const;

  template< class ValueType >
  ValueType Get( void ) const
  {
    const std::any & TheValue = GetValue();

    if ( const ValueType * Typed = std::any_cast< ValueType >( &TheValue ) )
      return *Typed;

    throw PayloadTypeError( "Result of task " + std::to_string( ID )
                            + " holds " + PayloadTypeName( TheValue )
                            + " and not " + PayloadTypeName< ValueType >() );
  }
};

/*==============================================================================

 Reply target

==============================================================================*/
//
// A worker delivers exactly one result for every task it executes. If the task
// is abandoned because the worker is stopped, the reply target is informed so
// that threads waiting for the result can be released.

class ReplyTarget
{
public:

  virtual void Deliver( const Result & TheResult ) = 0;

  virtual void Abandon( TaskIdentifier TheTask )
  {}

  ReplyTarget( void ) = default;
  virtual ~ReplyTarget() = default;
};

/*==============================================================================

 Task

==============================================================================*/

class Task
{
public:

  using Identifier  = TaskIdentifier;
  using Priority    = int;
  using Computation = std::function< std::any( const std::any & ) >;

private:

  // The identifiers are unique over the lifetime of the application, and they
  // are taken from a global counter of created tasks.

  static std::atomic< Identifier > TotalTasksCreated;

  inline static Identifier GetNewID( void )
  { return ++TotalTasksCreated; }

public:

  const Identifier                    ID;
  const Priority                      Level;
  const std::any                      Payload;
  const Computation                   Function;
  const std::shared_ptr< ReplyTarget > ReplyTo;

  Task( Computation TheComputation, std::any ThePayload = std::any(),
        Priority ThePriority = 0,
        std::shared_ptr< ReplyTarget > TheReplyTarget = nullptr );

  // A task can be copied with a different reply target. The copy is the same
  // task and keeps the identifier. The worker uses this to insert the result
  // handle returned to the submitter in front of the task's own target.

  Task( const Task & Other, std::shared_ptr< ReplyTarget > TheReplyTarget );

  Task( const Task & Other ) = default;
  Task & operator = ( const Task & Other ) = delete;

  std::any Execute( void ) const
  { return Function( Payload ); }

  template< class PayloadType >
  const PayloadType & GetPayload( void ) const
  {
    if ( const PayloadType * Typed = std::any_cast< PayloadType >( &Payload ) )
      return *Typed;

    throw PayloadTypeError( "Task " + std::to_string( ID ) + " carries "
                            + PayloadTypeName( Payload ) + " and not "
                            + PayloadTypeName< PayloadType >() );
  }
};

using TaskPointer = std::shared_ptr< const Task >;

// The typed task helper wraps a function of the payload type. Functions
// returning void produce an empty value.

template< class PayloadType, class FunctionType >
Task MakeTask( FunctionType TheFunction, PayloadType ThePayload,
               Task::Priority ThePriority = 0,
               std::shared_ptr< ReplyTarget > TheReplyTarget = nullptr )
{
  using ReturnType = std::invoke_result_t< FunctionType, const PayloadType & >;

  Task::Computation Wrapper =
    [TheFunction]( const std::any & Input )->std::any
    {
      const PayloadType * Typed = std::any_cast< PayloadType >( &Input );

      if ( Typed == nullptr )
        throw PayloadTypeError( "Computation expects "
                                + PayloadTypeName< PayloadType >()
                                + " but the payload is "
                                + PayloadTypeName( Input ) );

      if constexpr ( std::is_void_v< ReturnType > )
      {
        TheFunction( *Typed );
        return std::any();
      }
      else
        return std::any( TheFunction( *Typed ) );
    };

  return Task( std::move( Wrapper ), std::any( std::move( ThePayload ) ),
               ThePriority, std::move( TheReplyTarget ) );
}

/*==============================================================================

 Result handle

==============================================================================*/
//
// The handle is returned by the submit functions. The waiting thread can give
// up waiting at any time. It can also cancel the handle, after which a result
// arriving is discarded by the handle. Cancelling concerns only the caller
// holding the handle, and the result is still forwarded to the task's own
// reply target. The result is forwarded before the handle becomes ready, so a
// thread released from waiting will see everything the forward target did
// with the result.

class ResultHandle : public ReplyTarget
{
private:

  const TaskIdentifier           ID;
  std::shared_ptr< ReplyTarget > Forward;

  mutable std::mutex              Guard;
  std::condition_variable         Arrived;
  std::optional< Result >         TheResult;
  bool                            Answered, Abandoned, Cancelled;

  void Store( const Result & NewResult );
  void MarkAbandoned( void );

public:

  ResultHandle( TaskIdentifier TheTask,
                std::shared_ptr< ReplyTarget > ForwardTo = nullptr );

  virtual void Deliver( const Result & NewResult ) override;
  virtual void Abandon( TaskIdentifier TheTask ) override;

  inline TaskIdentifier TaskID( void ) const
  { return ID; }

  bool Ready( void ) const;
  bool IsAbandoned( void ) const;
  void Cancel( void );

  // The unbounded wait returns the result, and throws Worker Terminated if the
  // task was abandoned.

  Result Wait( void );

  // The timed wait returns nothing if the time out expired or if the task was
  // abandoned.

  template< class Rep, class Period >
  std::optional< Result > WaitFor(
                            const std::chrono::duration< Rep, Period > & Timeout )
  {
    std::unique_lock< std::mutex > Lock( Guard );

    Arrived.wait_for( Lock, Timeout,
                      [this]{ return TheResult.has_value() || Abandoned; } );

    return TheResult;
  }
};

/*==============================================================================

 Result collector

==============================================================================*/
//
// The collector is the reply mailbox of a caller that submits many tasks. The
// results are kept in order of arrival until they are taken.

class ResultCollector : public ReplyTarget
{
private:

  mutable std::mutex            Guard;
  std::condition_variable       Arrived;
  std::deque< Result >          Pending;
  std::vector< TaskIdentifier > Received;
  std::set< TaskIdentifier >    AbandonedTasks;

public:

  virtual void Deliver( const Result & NewResult ) override;
  virtual void Abandon( TaskIdentifier TheTask ) override;

  // The number of results delivered since the collector was created,
  // including the ones already taken.

  std::size_t Count( void ) const;

  // The identifiers of all tasks that have delivered results, in order of
  // delivery.

  std::vector< TaskIdentifier > DeliveryOrder( void ) const;

  std::set< TaskIdentifier > Abandoned( void ) const;

  // Takes the oldest pending result, waiting at most the time out

  template< class Rep, class Period >
  std::optional< Result > Next(
                            const std::chrono::duration< Rep, Period > & Timeout )
  {
    std::unique_lock< std::mutex > Lock( Guard );

    if ( !Arrived.wait_for( Lock, Timeout, [this]{ return !Pending.empty(); } ) )
      return std::nullopt;

    Result Oldest( Pending.front() );
    Pending.pop_front();
    return Oldest;
  }

  // Waits until the given number of results have been delivered in total, and
  // returns false if this did not happen within the time out.

  template< class Rep, class Period >
  bool WaitForCount( std::size_t Expected,
                     const std::chrono::duration< Rep, Period > & Timeout )
  {
    std::unique_lock< std::mutex > Lock( Guard );

    return Arrived.wait_for( Lock, Timeout,
                             [&]{ return Received.size() >= Expected; } );
  }
};

/*==============================================================================

 Reply callback

==============================================================================*/

class ReplyCallback : public ReplyTarget
{
public:

  using Function = std::function< void( const Result & ) >;

private:

  Function Callback;

public:

  ReplyCallback( Function TheCallback )
  : ReplyTarget(), Callback( std::move( TheCallback ) )
  {}

  virtual void Deliver( const Result & NewResult ) override
  { Callback( NewResult ); }
};

}      // Name space Taskforce
#endif // TASKFORCE_TASK
