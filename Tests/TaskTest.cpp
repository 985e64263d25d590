/*==============================================================================
Task Test

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "Errors.hpp"
#include "Task.hpp"

namespace Taskforce
{
namespace
{

TEST( TaskTest, IdentifiersAreUniqueAndIncreasing )
{
  auto Nothing = []( const std::any & ){ return std::any(); };

  Task First( Nothing ), Second( Nothing );

  EXPECT_LT( First.ID, Second.ID );
  EXPECT_EQ( First.Level, 0 );
  EXPECT_EQ( First.ReplyTo, nullptr );
}

TEST( TaskTest, TaskWithoutComputationIsRejected )
{
  EXPECT_THROW( Task Empty{ Task::Computation() }, std::invalid_argument );
}

TEST( TaskTest, TypedTaskComputesOnItsPayload )
{
  Task Doubling = MakeTask( []( const int & Value ){ return 2 * Value; }, 21 );

  EXPECT_EQ( Doubling.GetPayload< int >(), 21 );
  EXPECT_EQ( std::any_cast< int >( Doubling.Execute() ), 42 );
  EXPECT_THROW( Doubling.GetPayload< std::string >(), PayloadTypeError );
}

TEST( TaskTest, TypedComputationRejectsWrongPayload )
{
  Task Typed = MakeTask( []( const int & Value ){ return Value; }, 1 );
  Task Mismatched( Typed.Function, std::string( "one" ) );

  try
  {
    Mismatched.Execute();
    FAIL() << "The payload type error was not thrown";
  }
  catch ( const PayloadTypeError & Failure )
  {
    std::string Message( Failure.what() );

    EXPECT_NE( Message.find( "int" ), std::string::npos );
    EXPECT_NE( Message.find( "string" ), std::string::npos );
  }
}

TEST( TaskTest, VoidComputationGivesEmptyValue )
{
  int Touched = 0;
  Task Touching = MakeTask( [&Touched]( const int & Value ){ Touched = Value; },
                            5 );

  EXPECT_FALSE( Touching.Execute().has_value() );
  EXPECT_EQ( Touched, 5 );
}

TEST( TaskTest, CopyWithReplyTargetKeepsIdentity )
{
  Task Original = MakeTask( []( const int & Value ){ return Value; }, 3, 8 );
  auto Handle   = std::make_shared< ResultHandle >( Original.ID );
  Task Copy( Original, Handle );

  EXPECT_EQ( Copy.ID, Original.ID );
  EXPECT_EQ( Copy.Level, 8 );
  EXPECT_EQ( Copy.ReplyTo, Handle );
}

// -----------------------------------------------------------------------------
// Results
// -----------------------------------------------------------------------------

TEST( ResultTest, SuccessGivesTypedValue )
{
  Result Done = Result::Success( 7, std::any( 3.5 ) );

  EXPECT_TRUE( Done.IsSuccess() );
  EXPECT_EQ( Done.TaskID(), 7u );
  EXPECT_DOUBLE_EQ( Done.Get< double >(), 3.5 );
  EXPECT_THROW( Done.Get< int >(), PayloadTypeError );
  EXPECT_THROW( Done.GetErrorKind(), std::logic_error );
}

TEST( ResultTest, FailureRaisesItsKind )
{
  Result Failed = Result::Failure( 9, ErrorKind::WorkerTerminated, "gone" );

  EXPECT_FALSE( Failed.IsSuccess() );
  EXPECT_EQ( Failed.GetErrorKind(), ErrorKind::WorkerTerminated );
  EXPECT_EQ( Failed.GetMessage(), "gone" );
  EXPECT_THROW( Failed.GetValue(), WorkerTerminated );
  EXPECT_THROW( Failed.Get< int >(), WorkerTerminated );
}

// -----------------------------------------------------------------------------
// Reply targets
// -----------------------------------------------------------------------------

TEST( ResultHandleTest, WaitReturnsDeliveredResultAndForwards )
{
  auto Collector = std::make_shared< ResultCollector >();
  auto Handle    = std::make_shared< ResultHandle >( 11, Collector );

  std::thread Producer( [Handle]{
    std::this_thread::sleep_for( std::chrono::milliseconds( 20 ) );
    Handle->Deliver( Result::Success( 11, std::any( 1 ) ) );
  });

  Result Received = Handle->Wait();
  Producer.join();

  EXPECT_EQ( Received.Get< int >(), 1 );
  EXPECT_TRUE( Handle->Ready() );
  EXPECT_EQ( Collector->Count(), 1u );
}

TEST( ResultHandleTest, TimedWaitGivesNothingOnTimeout )
{
  ResultHandle Handle( 12 );

  EXPECT_FALSE( Handle.WaitFor( std::chrono::milliseconds( 10 ) ).has_value() );
  EXPECT_FALSE( Handle.Ready() );
}

TEST( ResultHandleTest, CancelledHandleDiscardsResultButForwards )
{
  auto Collector = std::make_shared< ResultCollector >();
  ResultHandle Handle( 13, Collector );

  Handle.Cancel();
  Handle.Deliver( Result::Success( 13, std::any( 1 ) ) );

  EXPECT_FALSE( Handle.Ready() );
  EXPECT_FALSE( Handle.WaitFor( std::chrono::milliseconds( 0 ) ).has_value() );
  EXPECT_EQ( Collector->Count(), 1u );
}

TEST( ResultHandleTest, ForwardTargetRunsBeforeHandleIsReady )
{
  std::shared_ptr< ResultHandle > Handle;
  bool ReadyWhenForwarded = true;

  auto Callback = std::make_shared< ReplyCallback >(
    [&]( const Result & ){ ReadyWhenForwarded = Handle->Ready(); });

  Handle = std::make_shared< ResultHandle >( 15, Callback );
  Handle->Deliver( Result::Success( 15, std::any( 2 ) ) );

  EXPECT_FALSE( ReadyWhenForwarded );
  EXPECT_TRUE( Handle->Ready() );
  EXPECT_EQ( Handle->Wait().Get< int >(), 2 );
}

TEST( ResultHandleTest, FailingForwardTargetStillReleasesWaiter )
{
  auto Throwing = std::make_shared< ReplyCallback >(
    []( const Result & ){ throw std::runtime_error( "unreachable" ); });

  ResultHandle Handle( 16, Throwing );

  EXPECT_THROW( Handle.Deliver( Result::Success( 16, std::any( 3 ) ) ),
                std::runtime_error );
  EXPECT_TRUE( Handle.Ready() );

  // A second delivery of the same task is ignored

  Handle.Deliver( Result::Success( 16, std::any( 4 ) ) );
  EXPECT_EQ( Handle.Wait().Get< int >(), 3 );
}

TEST( ResultHandleTest, AbandonedTaskReleasesWaiter )
{
  auto Collector = std::make_shared< ResultCollector >();
  ResultHandle Handle( 14, Collector );

  Handle.Abandon( 14 );

  EXPECT_TRUE( Handle.IsAbandoned() );
  EXPECT_THROW( Handle.Wait(), WorkerTerminated );
  EXPECT_EQ( Collector->Abandoned().count( 14 ), 1u );
}

TEST( ResultCollectorTest, KeepsDeliveryOrder )
{
  ResultCollector Collector;

  for ( TaskIdentifier ID : { 5, 3, 9 } )
    Collector.Deliver( Result::Success( ID, std::any() ) );

  EXPECT_EQ( Collector.DeliveryOrder(),
             ( std::vector< TaskIdentifier >{ 5, 3, 9 } ) );
  EXPECT_TRUE( Collector.WaitForCount( 3, std::chrono::milliseconds( 0 ) ) );
  EXPECT_EQ( Collector.Next( std::chrono::milliseconds( 0 ) )->TaskID(), 5u );
  EXPECT_EQ( Collector.Count(), 3u );
}

TEST( ReplyCallbackTest, InvokesFunctionForEachResult )
{
  std::vector< TaskIdentifier > Seen;
  ReplyCallback Callback( [&Seen]( const Result & TheResult ){
    Seen.push_back( TheResult.TaskID() ); });

  Callback.Deliver( Result::Success( 1, std::any() ) );
  Callback.Deliver( Result::Failure( 2, ErrorKind::TaskExecutionFailure, "" ) );

  EXPECT_EQ( Seen, ( std::vector< TaskIdentifier >{ 1, 2 } ) );
}

}  // anonymous name space
}  // Name space Taskforce
