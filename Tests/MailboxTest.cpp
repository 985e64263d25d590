/*==============================================================================
Mailbox Test

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "Errors.hpp"
#include "Mailbox.hpp"

namespace Taskforce
{
namespace
{

TaskPointer Prioritised( Task::Priority Level = 0 )
{
  return std::make_shared< const Task >(
    []( const std::any & ){ return std::any(); }, std::any(), Level );
}

TEST( MailboxTest, ArrivalOrderIgnoresPriorities )
{
  Mailbox Queue( Mailbox::Parameters( 0, Mailbox::FullPolicy::Block,
                                      Mailbox::Ordering::Arrival ) );

  TaskPointer Low = Prioritised( 1 ), High = Prioritised( 9 );

  Queue.StoreMessage( Low );
  Queue.StoreMessage( High );

  EXPECT_EQ( Queue.NextMessage().TheTask, Low );
  Queue.MessageCompleted();
  EXPECT_EQ( Queue.NextMessage().TheTask, High );
  Queue.MessageCompleted();
}

TEST( MailboxTest, PriorityOrderServesUrgentTasksFirst )
{
  Mailbox Queue;

  TaskPointer Low = Prioritised( 1 ), High = Prioritised( 9 );

  Queue.StoreMessage( Low );
  Queue.StoreMessage( High );

  EXPECT_EQ( Queue.NextMessage().TheTask, High );
  EXPECT_EQ( Queue.Depth(), 2u );
  Queue.MessageCompleted();
  EXPECT_EQ( Queue.Depth(), 1u );
}

TEST( MailboxTest, FullMailboxFailsWithFailPolicy )
{
  Mailbox Queue( Mailbox::Parameters( 2, Mailbox::FullPolicy::Fail ) );

  Queue.StoreMessage( Prioritised() );
  Queue.StoreMessage( Prioritised() );

  EXPECT_THROW( Queue.StoreMessage( Prioritised() ), MailboxFull );
  EXPECT_EQ( Queue.Size(), 2u );
}

TEST( MailboxTest, FullMailboxBlocksSenderUntilSpace )
{
  Mailbox Queue( Mailbox::Parameters( 1, Mailbox::FullPolicy::Block ) );

  Queue.StoreMessage( Prioritised() );

  std::atomic< bool > Stored( false );
  auto Sender = std::async( std::launch::async, [&]{
    Queue.StoreMessage( Prioritised() );
    Stored = true;
  });

  std::this_thread::sleep_for( std::chrono::milliseconds( 50 ) );
  EXPECT_FALSE( Stored );

  Queue.NextMessage();
  Sender.get();

  EXPECT_TRUE( Stored );
  EXPECT_EQ( Queue.Size(), 1u );
}

TEST( MailboxTest, StopReleasesBlockedSender )
{
  Mailbox Queue( Mailbox::Parameters( 1, Mailbox::FullPolicy::Block ) );

  Queue.StoreMessage( Prioritised() );

  auto Sender = std::async( std::launch::async, [&]{
    Queue.StoreMessage( Prioritised() ); });

  std::this_thread::sleep_for( std::chrono::milliseconds( 20 ) );

  EXPECT_EQ( Queue.RequestStop().size(), 1u );
  EXPECT_THROW( Sender.get(), WorkerTerminated );
  EXPECT_THROW( Queue.StoreMessage( Prioritised() ), WorkerTerminated );
}

TEST( MailboxTest, StopIsDeliveredAheadOfTasksAndSuspension )
{
  Mailbox Queue;

  Queue.StoreMessage( Prioritised() );
  Queue.Suspend();
  Queue.RequestStop();

  EXPECT_EQ( Queue.NextMessage().What, Mailbox::Signal::Stop );
}

TEST( MailboxTest, SuspendedMailboxWithholdsTasks )
{
  Mailbox Queue;

  EXPECT_TRUE( Queue.Suspend() );
  EXPECT_FALSE( Queue.Suspend() );

  Queue.StoreMessage( Prioritised() );

  auto Receiver = std::async( std::launch::async, [&]{
    return Queue.NextMessage(); });

  EXPECT_EQ( Receiver.wait_for( std::chrono::milliseconds( 50 ) ),
             std::future_status::timeout );

  EXPECT_TRUE( Queue.Release() );
  EXPECT_EQ( Receiver.get().What, Mailbox::Signal::Deliver );
}

TEST( MailboxTest, ShutdownDeliversPendingTasksBeforeDrained )
{
  Mailbox Queue;

  Queue.StoreMessage( Prioritised() );
  Queue.Suspend();
  Queue.RequestShutdown();

  EXPECT_THROW( Queue.StoreMessage( Prioritised() ), WorkerTerminated );
  EXPECT_EQ( Queue.NextMessage().What, Mailbox::Signal::Deliver );
  Queue.MessageCompleted();
  EXPECT_EQ( Queue.NextMessage().What, Mailbox::Signal::Drained );
}

TEST( MailboxTest, RefusedMailboxKeepsTasksUntilDrained )
{
  Mailbox Queue;

  Queue.StoreMessage( Prioritised() );
  Queue.StoreMessage( Prioritised() );
  Queue.Refuse();

  EXPECT_FALSE( Queue.IsAccepting() );
  EXPECT_THROW( Queue.StoreMessage( Prioritised() ), WorkerTerminated );
  EXPECT_EQ( Queue.Size(), 2u );

  Queue.Reopen();
  EXPECT_TRUE( Queue.IsAccepting() );

  Queue.Refuse();
  EXPECT_EQ( Queue.Drain().size(), 2u );
  EXPECT_EQ( Queue.Size(), 0u );
}

TEST( MailboxTest, WaitUntilEmptyReturnsWhenLastTaskCompletes )
{
  Mailbox Queue;

  Queue.StoreMessage( Prioritised() );

  auto Waiter = std::async( std::launch::async, [&]{
    Queue.WaitUntilEmpty(); });

  Queue.NextMessage();

  EXPECT_EQ( Waiter.wait_for( std::chrono::milliseconds( 50 ) ),
             std::future_status::timeout );

  Queue.MessageCompleted();
  Waiter.get();
}

}  // anonymous name space
}  // Name space Taskforce
