/*==============================================================================
Supervisor Test

Most tests supervise a scripted entity that reports faults on request and
counts how often it is restarted and abandoned. The last tests supervise real
workers and a nested supervisor.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "Errors.hpp"
#include "Supervisor.hpp"
#include "Worker.hpp"
#include "TestUtilities.hpp"

namespace Taskforce
{
namespace
{

using Test::EventRecorder;
using Test::Patience;
using namespace std::chrono_literals;

class ScriptedEntity : public SupervisedEntity
{
private:

  const std::string       EntityName;
  mutable std::mutex      Guard;
  std::condition_variable Changed;
  unsigned int            Restarts, Abandons;

public:

  void Fail( const std::string & Details = "scripted fault" )
  {
    Emit( LifecycleEvent::Exited( EntityName,
                                  LifecycleEvent::ExitReason::Fault, Details ) );
  }

  void Exit( void )
  {
    Emit( LifecycleEvent::Exited( EntityName,
                                  LifecycleEvent::ExitReason::Requested ) );
  }

  void ReportError( void )
  {
    Emit( LifecycleEvent::Failed( EntityName, ErrorKind::TaskExecutionFailure,
                                  "scripted error" ) );
  }

  unsigned int RestartCount( void ) const
  {
    std::lock_guard< std::mutex > Lock( Guard );
    return Restarts;
  }

  unsigned int AbandonCount( void ) const
  {
    std::lock_guard< std::mutex > Lock( Guard );
    return Abandons;
  }

  bool WaitForRestarts( unsigned int Expected )
  {
    std::unique_lock< std::mutex > Lock( Guard );
    return Changed.wait_for( Lock, Patience,
                             [&]{ return Restarts >= Expected; } );
  }

  bool WaitForAbandon( void )
  {
    std::unique_lock< std::mutex > Lock( Guard );
    return Changed.wait_for( Lock, Patience, [this]{ return Abandons > 0; } );
  }

  virtual std::string Name( void ) const override
  { return EntityName; }

  virtual void Restart( void ) override
  {
    std::lock_guard< std::mutex > Lock( Guard );
    Restarts++;
    Changed.notify_all();
  }

  virtual void Abandon( void ) override
  {
    std::lock_guard< std::mutex > Lock( Guard );
    Abandons++;
    Changed.notify_all();
  }

  ScriptedEntity( const std::string & TheName )
  : SupervisedEntity(), EntityName( TheName ), Guard(), Changed(),
    Restarts( 0 ), Abandons( 0 )
  {}
};

Supervisor::Parameters QuickRestarts( unsigned int MaxRestarts,
                        Supervisor::Clock::duration Window = 60s )
{
  return Supervisor::Parameters( MaxRestarts, Window,
                                 Supervisor::Backoff::Constant, 1ms, 1ms );
}

// -----------------------------------------------------------------------------
// Back off
// -----------------------------------------------------------------------------

TEST( SupervisorTest, RestartDelayFollowsStrategy )
{
  Supervisor::Parameters Exponential( 3, 60s, Supervisor::Backoff::Exponential,
                                      100ms, 1s );

  EXPECT_EQ( Supervisor::RestartDelay( Exponential, 0 ), 100ms );
  EXPECT_EQ( Supervisor::RestartDelay( Exponential, 1 ), 200ms );
  EXPECT_EQ( Supervisor::RestartDelay( Exponential, 3 ), 800ms );
  EXPECT_EQ( Supervisor::RestartDelay( Exponential, 4 ), 1s );
  EXPECT_EQ( Supervisor::RestartDelay( Exponential, 200 ), 1s );

  Supervisor::Parameters Linear( 3, 60s, Supervisor::Backoff::Linear,
                                 100ms, 1s );

  EXPECT_EQ( Supervisor::RestartDelay( Linear, 0 ), 100ms );
  EXPECT_EQ( Supervisor::RestartDelay( Linear, 2 ), 300ms );
  EXPECT_EQ( Supervisor::RestartDelay( Linear, 20 ), 1s );

  Supervisor::Parameters Constant( 3, 60s, Supervisor::Backoff::Constant,
                                   100ms, 1s );

  EXPECT_EQ( Supervisor::RestartDelay( Constant, 5 ), 100ms );
}

TEST( SupervisorTest, RestartWaitsForBackoffDelay )
{
  ScriptedEntity Entity( "Entity" );
  Supervisor TheSupervisor( "Supervisor", Supervisor::Parameters(
    3, 60s, Supervisor::Backoff::Constant, 300ms, 1s ) );

  TheSupervisor.Manage( Entity );

  auto Start = std::chrono::steady_clock::now();

  Entity.Fail();

  ASSERT_TRUE( Entity.WaitForRestarts( 1 ) );
  EXPECT_GE( std::chrono::steady_clock::now() - Start, 300ms );
}

// -----------------------------------------------------------------------------
// Restart budget
// -----------------------------------------------------------------------------

TEST( SupervisorTest, GivesUpWhenRestartBudgetIsExceeded )
{
  ScriptedEntity Entity( "Entity" );
  EventRecorder  Parent;
  Supervisor     TheSupervisor( "Supervisor", QuickRestarts( 2 ) );

  TheSupervisor.Manage( Entity );
  TheSupervisor.Subscribe( Parent );

  for ( unsigned int i = 1; i <= 2; i++ )
  {
    Entity.Fail();
    ASSERT_TRUE( Entity.WaitForRestarts( i ) );
  }

  Entity.Fail();

  ASSERT_TRUE( Entity.WaitForAbandon() );
  ASSERT_TRUE( Parent.WaitFor( Taskforce::Test::IsFault ) );

  EXPECT_EQ( Entity.RestartCount(), 2u );
  EXPECT_EQ( TheSupervisor.RestartCount( "Entity" ), 2u );
  EXPECT_EQ( TheSupervisor.PermanentFailures(),
             std::vector< std::string >{ "Entity" } );

  std::vector< LifecycleEvent > Recorded = Parent.Recorded();
  auto Exceeded = std::find_if( Recorded.begin(), Recorded.end(),
                    Taskforce::Test::IsError( ErrorKind::RestartBudgetExceeded ) );
  auto Exit     = std::find_if( Recorded.begin(), Recorded.end(),
                                Taskforce::Test::IsFault );

  ASSERT_NE( Exceeded, Recorded.end() );
  EXPECT_TRUE( Exceeded < Exit );
  EXPECT_EQ( Exit->Source, "Supervisor" );

  // Further faults of a given up entity are ignored

  Entity.Fail();
  std::this_thread::sleep_for( 50ms );

  EXPECT_EQ( Entity.RestartCount(), 2u );
  EXPECT_EQ( Entity.AbandonCount(), 1u );

  TheSupervisor.Unsubscribe( Parent );
}

TEST( SupervisorTest, FaultsSpreadOverTimeStayWithinBudget )
{
  ScriptedEntity Entity( "Entity" );
  Supervisor     TheSupervisor( "Supervisor", QuickRestarts( 1, 50ms ) );

  TheSupervisor.Manage( Entity );

  for ( unsigned int i = 1; i <= 3; i++ )
  {
    Entity.Fail();
    ASSERT_TRUE( Entity.WaitForRestarts( i ) );
    std::this_thread::sleep_for( 100ms );
  }

  EXPECT_EQ( Entity.AbandonCount(), 0u );
  EXPECT_TRUE( TheSupervisor.PermanentFailures().empty() );
  EXPECT_EQ( TheSupervisor.RestartCount( "Entity" ), 3u );
}

TEST( SupervisorTest, RequestedExitAndErrorsAreNotRestarted )
{
  ScriptedEntity Entity( "Entity" );
  Supervisor     TheSupervisor( "Supervisor", QuickRestarts( 3 ) );

  TheSupervisor.Manage( Entity );

  Entity.ReportError();
  Entity.Exit();

  std::this_thread::sleep_for( 100ms );

  EXPECT_EQ( Entity.RestartCount(), 0u );
  EXPECT_EQ( TheSupervisor.RestartCount( "Entity" ), 0u );
}

// -----------------------------------------------------------------------------
// Management
// -----------------------------------------------------------------------------

TEST( SupervisorTest, EntitiesAreManagedByUniqueName )
{
  ScriptedEntity First( "Entity" ), Second( "Entity" );
  Supervisor     TheSupervisor( "Supervisor" );

  TheSupervisor.Manage( First );

  EXPECT_TRUE( TheSupervisor.IsManaged( "Entity" ) );
  EXPECT_THROW( TheSupervisor.Manage( Second ), std::invalid_argument );
  EXPECT_THROW( TheSupervisor.Release( "Other" ), std::invalid_argument );
  EXPECT_THROW( TheSupervisor.RestartCount( "Other" ), std::invalid_argument );

  TheSupervisor.Release( "Entity" );

  EXPECT_FALSE( TheSupervisor.IsManaged( "Entity" ) );

  First.Fail();
  std::this_thread::sleep_for( 50ms );

  EXPECT_EQ( First.RestartCount(), 0u );
}

TEST( SupervisorTest, StoppedSupervisorCannotManage )
{
  ScriptedEntity Entity( "Entity" );
  EventRecorder  Parent;
  Supervisor     TheSupervisor( "Supervisor" );

  TheSupervisor.Subscribe( Parent );
  TheSupervisor.Stop();

  EXPECT_THROW( TheSupervisor.Manage( Entity ), std::logic_error );
  EXPECT_EQ( Parent.Count( []( const LifecycleEvent & TheEvent ){
               return TheEvent.What == LifecycleEvent::Kind::Exited &&
                      TheEvent.Reason == LifecycleEvent::ExitReason::Requested;
             } ), 1u );

  TheSupervisor.Unsubscribe( Parent );
}

// -----------------------------------------------------------------------------
// Supervision trees
// -----------------------------------------------------------------------------

TEST( SupervisorTest, ParentRestartsChildThatGaveUp )
{
  ScriptedEntity Entity( "Entity" );
  Supervisor     Child( "Child", QuickRestarts( 1 ) );
  Supervisor     Parent( "Parent", QuickRestarts( 3 ) );

  Child.Manage( Entity );
  Parent.Manage( Child );

  Entity.Fail();
  ASSERT_TRUE( Entity.WaitForRestarts( 1 ) );

  // The second fault exceeds the child's budget. The parent restarts the
  // child, and the child revives the entity it had given up.

  Entity.Fail();

  ASSERT_TRUE( Entity.WaitForAbandon() );
  ASSERT_TRUE( Entity.WaitForRestarts( 2 ) );

  EXPECT_EQ( Parent.RestartCount( "Child" ), 1u );
  EXPECT_TRUE( Parent.PermanentFailures().empty() );
  EXPECT_TRUE( Child.PermanentFailures().empty() );
  EXPECT_EQ( Child.RestartCount( "Entity" ), 2u );

  // The child has a fresh budget after its restart

  Entity.Fail();
  ASSERT_TRUE( Entity.WaitForRestarts( 3 ) );
  EXPECT_EQ( Entity.AbandonCount(), 1u );
}

TEST( SupervisorTest, FailedWorkerIsRestartedWithItsPendingTasks )
{
  Taskforce::Test::Gate Blocker;
  EventRecorder Events;
  auto Collector = std::make_shared< ResultCollector >();

  Worker     TheWorker( 0 );
  Supervisor TheSupervisor( "Supervisor", QuickRestarts( 3 ) );

  TheSupervisor.Manage( TheWorker );
  TheWorker.Subscribe( Events );

  TheWorker.Submit( MakeTask( [&Blocker]( const int & Input ){
                                Blocker.Pass(); return Input; }, 0 ) );
  ASSERT_TRUE( Blocker.WaitForArrivals( 1 ) );

  TheWorker.Submit( Task( []( const std::any & )->std::any {
    throw WorkerFatalFault( "corrupted" ); }, std::any(), 5 ) );

  for ( int i = 0; i < 3; i++ )
    TheWorker.Submit( MakeTask( []( const int & Input ){ return Input; }, i, 0,
                                Collector ) );

  Blocker.Open();

  ASSERT_TRUE( Events.WaitFor( Taskforce::Test::IsFault ) );
  ASSERT_TRUE( Collector->WaitForCount( 3, Patience ) );

  EXPECT_EQ( TheSupervisor.RestartCount( "Worker0" ), 1u );
  EXPECT_FALSE( TheWorker.IsFaulted() );

  TheWorker.Unsubscribe( Events );
}

TEST( SupervisorTest, WorkerFailingTooOftenFailsItsPendingTasks )
{
  EventRecorder Events;
  auto Collector = std::make_shared< ResultCollector >();

  Worker     TheWorker( 0 );
  Supervisor TheSupervisor( "Supervisor", QuickRestarts( 0 ) );

  TheSupervisor.Manage( TheWorker );
  TheSupervisor.Subscribe( Events );

  TheWorker.Pause();

  TheWorker.Submit( Task( []( const std::any & )->std::any {
    throw WorkerFatalFault( "corrupted" ); }, std::any(), 5 ) );
  auto Pending = TheWorker.Submit( MakeTask(
    []( const int & Input ){ return Input; }, 1, 0, Collector ) );

  TheWorker.ShutdownGraceful();

  ASSERT_TRUE( Events.WaitFor( Taskforce::Test::IsError(
                               ErrorKind::RestartBudgetExceeded ) ) );

  Result Failure = Pending->Wait();

  EXPECT_EQ( Failure.GetErrorKind(), ErrorKind::WorkerTerminated );
  EXPECT_TRUE( TheWorker.IsPermanentlyFailed() );
  EXPECT_EQ( TheSupervisor.PermanentFailures(),
             std::vector< std::string >{ "Worker0" } );

  TheSupervisor.Unsubscribe( Events );
}

}  // anonymous name space
}  // Name space Taskforce
