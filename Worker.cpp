/*==============================================================================
Worker

The implementation of the worker is concerned with the interplay between the
Postman thread executing the tasks and the control functions called from other
threads. The state shared between them is protected by the state lock, and the
lock is never held while a computation runs or while a result is delivered,
since both may take arbitrary time and a reply target may call back into the
worker.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <sstream>                   // Error messages
#include <stdexcept>                 // Standard exceptions

#include "Errors.hpp"
#include "Utility/ConsoleOutput.hpp"
#include "Worker.hpp"

namespace Taskforce
{

std::string ToString( Worker::State TheState )
{
  switch ( TheState )
  {
    case Worker::State::Idle:       return "idle";
    case Worker::State::Busy:       return "busy";
    case Worker::State::Paused:     return "paused";
    case Worker::State::Terminated: return "terminated";
  }

  return "unknown";
}

/*==============================================================================

 Constructor and destructor

==============================================================================*/
//
// The Postman is started as the last action of the constructor when all the
// other members have been initialised.

Worker::Worker( Identifier TheID, const std::string & TheName,
                const Parameters & Settings )
: SupervisedEntity(), ID( TheID ),
  WorkerName( TheName.empty() ? "Worker" + std::to_string( TheID ) : TheName ),
  Inbox( Settings, WorkerName ),
  StateGuard(), StateChanged(), ActiveTask(), Abandonable(),
  InFlightAbandoned( false ), Terminated( false ), ShuttingDown( false ),
  PermanentlyFailed( false ), ExitCause(), PauseToken(),
  TokenGenerator( std::random_device{}() ), RestartGuard(), Postman()
{
  Postman = std::thread( &Worker::DispatchMessages, this );
}

// A running worker will complete the tasks it has accepted before it is
// destroyed. A worker that has terminated by a fault and has not been given up
// must answer its pending tasks since nobody will execute them.

Worker::~Worker()
{
  bool Running, Faulted;

  {
    std::lock_guard< std::mutex > Lock( StateGuard );

    Running = !Terminated;
    Faulted = Terminated && ExitCause == LifecycleEvent::ExitReason::Fault
              && !PermanentlyFailed;
  }

  if ( Running )
  {
    ShutdownGraceful();
    AwaitTermination();
  }
  else if ( Faulted )
    Abandon();

  if ( Postman.joinable() )
    Postman.join();
}

/*==============================================================================

 Dispatching tasks

==============================================================================*/

void Worker::Report( LifecycleEvent TheEvent )
{
  TheEvent.WorkerID = ID;
  Emit( TheEvent );
}

// The loop continues until the mailbox reports the stop request or the end of
// a shutdown, or until a task reports a fatal fault.

void Worker::DispatchMessages( void )
{
  Report( LifecycleEvent::Started( WorkerName ) );

  while ( true )
  {
    Mailbox::Delivery Next = Inbox.NextMessage();

    if ( Next.What == Mailbox::Signal::Stop )
      break;
    else if ( Next.What == Mailbox::Signal::Drained )
    {
      Terminate( LifecycleEvent::ExitReason::Requested, "shut down" );
      break;
    }

    std::optional< std::string > Fault = ExecuteTask( Next.TheTask );

    if ( Fault )
    {
      Terminate( LifecycleEvent::ExitReason::Fault, *Fault );
      break;
    }
  }
}

// The task is first registered as the active task so that a stop request
// arriving while the computation runs knows which task to abandon. When the
// computation returns, the stop flag decides if the result is delivered or
// discarded. The test and the clearing of the abandonable task happen under
// the same lock so that a task is never both abandoned and answered.

std::optional< std::string > Worker::ExecuteTask( const TaskPointer & TheTask )
{
  {
    std::lock_guard< std::mutex > Lock( StateGuard );

    ActiveTask        = TheTask->ID;
    Abandonable       = TheTask;
    InFlightAbandoned = false;
  }

  std::optional< Result >      Outcome;
  std::optional< std::string > Fatal;

  try
  {
    Outcome.emplace( Result::Success( TheTask->ID, TheTask->Execute() ) );
  }
  catch ( const WorkerFatalFault & Fault )
  {
    Fatal = Fault.what();
    Outcome.emplace( Result::Failure( TheTask->ID, ErrorKind::WorkerFatalFault,
                                      Fault.what() ) );
  }
  catch ( const std::exception & Failure )
  {
    Outcome.emplace( Result::Failure( TheTask->ID,
                                      ErrorKind::TaskExecutionFailure,
                                      Failure.what() ) );
  }
  catch ( ... )
  {
    Outcome.emplace( Result::Failure( TheTask->ID,
                                      ErrorKind::TaskExecutionFailure,
                                      "The computation threw a non-standard "
                                      "exception" ) );
  }

  bool Discard;

  {
    std::lock_guard< std::mutex > Lock( StateGuard );

    Discard           = InFlightAbandoned;
    InFlightAbandoned = false;
    Abandonable.reset();
  }

  if ( Discard )
    ConsoleOutput( ConsoleOutput::Severity::Debug, WorkerName )
      << "The result of the abandoned task " << TheTask->ID
      << " is discarded" << std::endl;
  else
  {
    if ( TheTask->ReplyTo )
      try
      {
        TheTask->ReplyTo->Deliver( *Outcome );
      }
      catch ( const std::exception & DeliveryError )
      {
        ConsoleOutput( ConsoleOutput::Severity::Error, WorkerName )
          << "Delivering the result of task " << TheTask->ID
          << " failed: " << DeliveryError.what() << std::endl;
      }

    if ( Outcome->IsSuccess() )
      Report( LifecycleEvent::Completed( WorkerName, TheTask->ID ) );
    else
    {
      LifecycleEvent Failure = LifecycleEvent::Failed(
        WorkerName, Outcome->GetErrorKind(), Outcome->GetMessage() );

      Failure.TaskID = TheTask->ID;
      Report( Failure );
    }
  }

  {
    std::lock_guard< std::mutex > Lock( StateGuard );
    ActiveTask.reset();
  }

  Inbox.MessageCompleted();

  return Fatal;
}

// Termination from the Postman. A stop request may already have terminated
// the worker, and in that case the exit has already been reported.

void Worker::Terminate( LifecycleEvent::ExitReason Reason,
                        const std::string & Details )
{
  {
    std::lock_guard< std::mutex > Lock( StateGuard );

    if ( Terminated ) return;

    Terminated = true;
    ExitCause  = Reason;
    PauseToken.reset();
  }

  if ( Reason == LifecycleEvent::ExitReason::Fault )
  {
    Inbox.Refuse();

    ConsoleOutput( ConsoleOutput::Severity::Warning, WorkerName )
      << "Terminated by a fatal fault with " << Inbox.Size()
      << " pending tasks: " << Details << std::endl;
  }

  StateChanged.notify_all();
  Report( LifecycleEvent::Exited( WorkerName, Reason, Details ) );
}

/*==============================================================================

 Submission

==============================================================================*/

std::shared_ptr< ResultHandle > Worker::Submit( const Task & TheTask )
{
  auto Handle = std::make_shared< ResultHandle >( TheTask.ID, TheTask.ReplyTo );

  Inbox.StoreMessage( std::make_shared< const Task >( TheTask, Handle ) );

  ConsoleOutput( ConsoleOutput::Severity::Trace, WorkerName )
    << "Accepted task " << TheTask.ID << " with priority "
    << TheTask.Level << std::endl;

  return Handle;
}

/*==============================================================================

 Control

==============================================================================*/

Worker::ResumeToken Worker::Pause( void )
{
  std::lock_guard< std::mutex > Lock( StateGuard );

  if ( Terminated || ShuttingDown )
    throw WorkerTerminated( WorkerName + " cannot be paused after termination "
                            "or shut down" );

  if ( PauseToken )
    throw AlreadyPaused( WorkerName + " is already paused" );

  Inbox.Suspend();

  std::uint64_t Value = TokenGenerator();
  PauseToken = Value;

  return ResumeToken( Value );
}

// The token is consumed by a successful resume so the same token cannot
// resume a later pause.

void Worker::Resume( const ResumeToken & Token )
{
  std::lock_guard< std::mutex > Lock( StateGuard );

  if ( !PauseToken )
    throw InvalidResumeToken( WorkerName + " is not paused" );

  if ( Token.Value != *PauseToken )
    throw InvalidResumeToken( WorkerName + " was paused with another token" );

  PauseToken.reset();
  Inbox.Release();
}

void Worker::Stop( void )
{
  TaskPointer InProgress;
  bool        WasRunning;

  {
    std::lock_guard< std::mutex > Lock( StateGuard );

    WasRunning = !Terminated;
    Terminated = true;
    ExitCause  = LifecycleEvent::ExitReason::Requested;
    PauseToken.reset();

    if ( Abandonable )
    {
      InProgress = Abandonable;
      InFlightAbandoned = true;
      Abandonable.reset();
    }
  }

  std::vector< TaskPointer > Removed = Inbox.RequestStop();

  StateChanged.notify_all();

  if ( InProgress && InProgress->ReplyTo )
    InProgress->ReplyTo->Abandon( InProgress->ID );

  for ( const TaskPointer & Pending : Removed )
    if ( Pending->ReplyTo )
      Pending->ReplyTo->Abandon( Pending->ID );

  if ( WasRunning )
  {
    ConsoleOutput( ConsoleOutput::Severity::Debug, WorkerName )
      << "Stopped with " << Removed.size() << " pending tasks abandoned"
      << std::endl;

    Report( LifecycleEvent::Exited( WorkerName,
                                    LifecycleEvent::ExitReason::Requested,
                                    "stopped" ) );
  }
}

void Worker::ShutdownGraceful( void )
{
  {
    std::lock_guard< std::mutex > Lock( StateGuard );

    if ( Terminated || ShuttingDown ) return;

    ShuttingDown = true;
    PauseToken.reset();
  }

  Inbox.RequestShutdown();
}

void Worker::AwaitTermination( void )
{
  if ( std::this_thread::get_id() == Postman.get_id() )
    throw std::logic_error( LocatedMessage(
      WorkerName + " cannot wait for its own termination",
      std::source_location::current() ) );

  std::unique_lock< std::mutex > Lock( StateGuard );
  StateChanged.wait( Lock, [this]{ return Terminated; } );
}

void Worker::DrainMailbox( void )
{
  if ( std::this_thread::get_id() != Postman.get_id() )
    Inbox.WaitUntilEmpty();
  else
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << WorkerName
                 << " cannot wait for its mailbox to drain from its own thread";

    throw std::logic_error( LocatedMessage( ErrorMessage.str(),
                                            std::source_location::current() ) );
  }
}

/*==============================================================================

 State queries

==============================================================================*/

Worker::State Worker::GetState( void ) const
{
  std::lock_guard< std::mutex > Lock( StateGuard );

  if ( Terminated )
    return State::Terminated;
  else if ( ActiveTask )
    return State::Busy;
  else if ( PauseToken )
    return State::Paused;
  else
    return State::Idle;
}

std::optional< TaskIdentifier > Worker::ActiveTaskID( void ) const
{
  std::lock_guard< std::mutex > Lock( StateGuard );
  return ActiveTask;
}

std::optional< LifecycleEvent::ExitReason > Worker::GetExitReason( void ) const
{
  std::lock_guard< std::mutex > Lock( StateGuard );
  return ExitCause;
}

bool Worker::IsFaulted( void ) const
{
  std::lock_guard< std::mutex > Lock( StateGuard );
  return Terminated && ExitCause == LifecycleEvent::ExitReason::Fault;
}

bool Worker::IsPermanentlyFailed( void ) const
{
  std::lock_guard< std::mutex > Lock( StateGuard );
  return PermanentlyFailed;
}

/*==============================================================================

 Supervision

==============================================================================*/

std::string Worker::Name( void ) const
{
  return WorkerName;
}

// Only a worker terminated by a fault can be restarted, also if it has been
// abandoned. The old Postman has left its loop when the fault was reported,
// and it is joined before the new Postman is started on the same mailbox.
// A stop request may arrive while the old Postman is joined, and the exit
// reason is therefore tested again before the worker is brought back. The
// mailbox is reopened and the new Postman started under the state lock so
// that a later stop request will find the worker running.

void Worker::Restart( void )
{
  if ( std::this_thread::get_id() == Postman.get_id() )
    throw std::logic_error( LocatedMessage(
      WorkerName + " cannot be restarted from its own thread",
      std::source_location::current() ) );

  std::lock_guard< std::mutex > Serialised( RestartGuard );

  if ( !IsFaulted() )
  {
    ConsoleOutput( ConsoleOutput::Severity::Warning, WorkerName )
      << "Restart ignored since the worker has not failed" << std::endl;
    return;
  }

  if ( Postman.joinable() )
    Postman.join();

  std::lock_guard< std::mutex > Lock( StateGuard );

  if ( !Terminated || ExitCause != LifecycleEvent::ExitReason::Fault )
  {
    ConsoleOutput( ConsoleOutput::Severity::Warning, WorkerName )
      << "Restart cancelled since the worker was stopped" << std::endl;
    return;
  }

  Terminated        = false;
  ShuttingDown      = false;
  PermanentlyFailed = false;
  InFlightAbandoned = false;
  ExitCause.reset();

  Inbox.Reopen();

  ConsoleOutput( ConsoleOutput::Severity::Information, WorkerName )
    << "Restarted with " << Inbox.Size() << " pending tasks" << std::endl;

  Postman = std::thread( &Worker::DispatchMessages, this );
}

void Worker::Abandon( void )
{
  {
    std::lock_guard< std::mutex > Lock( StateGuard );

    if ( !Terminated || ExitCause != LifecycleEvent::ExitReason::Fault )
    {
      ConsoleOutput( ConsoleOutput::Severity::Warning, WorkerName )
        << "Abandon ignored since the worker has not failed" << std::endl;
      return;
    }

    if ( PermanentlyFailed ) return;

    PermanentlyFailed = true;
  }

  std::vector< TaskPointer > Removed = Inbox.Drain();

  ConsoleOutput( ConsoleOutput::Severity::Error, WorkerName )
    << "Permanently failed, " << Removed.size()
    << " pending tasks will not be executed" << std::endl;

  for ( const TaskPointer & Pending : Removed )
    if ( Pending->ReplyTo )
      try
      {
        Pending->ReplyTo->Deliver( Result::Failure( Pending->ID,
          ErrorKind::WorkerTerminated, WorkerName + " failed permanently" ) );
      }
      catch ( const std::exception & DeliveryError )
      {
        ConsoleOutput( ConsoleOutput::Severity::Error, WorkerName )
          << "Delivering the failure of task " << Pending->ID
          << " failed: " << DeliveryError.what() << std::endl;
      }
}

}  // Name space Taskforce
