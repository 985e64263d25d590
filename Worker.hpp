/*==============================================================================
Worker

A worker is an isolated execution context. It has its own dispatcher thread,
called the Postman, and its own mailbox, and it shares nothing with the threads
submitting tasks to it except the tasks themselves, which are immutable, and
the reply targets receiving the results. The Postman takes one task at the time
from the mailbox, executes the task's computation, and delivers the result to
the task's reply target. A worker will therefore never execute two tasks
concurrently, and with the priority ordering of the mailbox the tasks are
executed in descending priority, and in the order of submission for tasks of
equal priority.

The worker can be controlled while it is running:

Pause:    The worker stops taking tasks from the mailbox once the task in
          progress, if any, has been completed. New tasks are still accepted.
          The pause returns a resume token, and only this token can resume the
          worker. A token can only be used once.
Stop:     The worker terminates immediately. The pending tasks are removed
          from the mailbox without being executed, and their reply targets are
          told that the tasks have been abandoned. The result of the task in
          progress is discarded when its computation returns.
Shutdown: The worker stops accepting new tasks, and terminates when all the
          tasks accepted before the shutdown have been executed. A pending
          pause is cancelled so that the shutdown will complete.

A computation may fail in two ways. An ordinary exception is reported as a
failure result to the reply target and as an error event to the observers, and
the worker continues with the next task. If the computation throws a Worker
Fatal Fault the execution context of the worker can no longer be trusted: the
task fails with a fatal fault result and the worker terminates with an exit
event indicating the fault. The pending tasks remain in the mailbox, and if a
supervisor restarts the worker they will be executed by the new Postman. If
the supervisor gives up, the worker is abandoned and all pending tasks fail
with Worker Terminated.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_WORKER
#define TASKFORCE_WORKER

#include <string>                    // Worker names
#include <thread>                    // The Postman
#include <mutex>                     // Protecting the state
#include <condition_variable>        // Waiting for termination
#include <optional>                  // Active task and exit reason
#include <memory>                    // Result handles
#include <random>                    // Resume tokens
#include <chrono>                    // Timed waits
#include <cstdint>                   // Token values

#include "Task.hpp"
#include "Mailbox.hpp"
#include "Lifecycle.hpp"

namespace Taskforce
{

class Worker : public SupervisedEntity
{
public:

  using Identifier = unsigned long;
  using Parameters = Mailbox::Parameters;

  enum class State
  {
    Idle,
    Busy,
    Paused,
    Terminated
  };

  // The resume token is opaque to everyone but the worker issuing it

  class ResumeToken
  {
  private:

    std::uint64_t Value;

    ResumeToken( std::uint64_t TheValue )
    : Value( TheValue )
    {}

    friend class Worker;

  public:

    ResumeToken( const ResumeToken & Other ) = default;
    ResumeToken & operator = ( const ResumeToken & Other ) = default;

    inline bool operator == ( const ResumeToken & Other ) const
    { return Value == Other.Value; }
  };

private:

  const Identifier  ID;
  const std::string WorkerName;

  Taskforce::Mailbox Inbox;

  // The state is protected by a lock since it is changed both by the Postman
  // and by the control functions called from other threads.

  mutable std::mutex      StateGuard;
  std::condition_variable StateChanged;

  std::optional< TaskIdentifier >                 ActiveTask;
  TaskPointer                                     Abandonable;
  bool                                            InFlightAbandoned,
                                                  Terminated,
                                                  ShuttingDown,
                                                  PermanentlyFailed;
  std::optional< LifecycleEvent::ExitReason >     ExitCause;
  std::optional< std::uint64_t >                  PauseToken;
  std::mt19937_64                                 TokenGenerator;

  // Restarts are serialised since the old Postman can only be joined once

  std::mutex  RestartGuard;
  std::thread Postman;

  // Events are stamped with the worker identifier before they are emitted

  void Report( LifecycleEvent TheEvent );

  // The Postman runs the dispatch loop, and the execution of one task will
  // return the explanation of a fatal fault if the computation reported one.

  void DispatchMessages( void );
  std::optional< std::string > ExecuteTask( const TaskPointer & TheTask );
  void Terminate( LifecycleEvent::ExitReason Reason,
                  const std::string & Details = std::string() );

public:

  // Submitting a task returns the handle that will receive the result. The
  // handle forwards the result to the task's own reply target if it has one.

  std::shared_ptr< ResultHandle > Submit( const Task & TheTask );

  ResumeToken Pause( void );
  void        Resume( const ResumeToken & Token );
  void        Stop( void );
  void        ShutdownGraceful( void );
  void        AwaitTermination( void );

  template< class Rep, class Period >
  bool WaitForTermination( const std::chrono::duration< Rep, Period > & Timeout )
  {
    std::unique_lock< std::mutex > Lock( StateGuard );
    return StateChanged.wait_for( Lock, Timeout, [this]{ return Terminated; } );
  }

  // Waiting for the mailbox to be empty cannot be done by the Postman since
  // it would then wait for itself.

  void DrainMailbox( void );

  State GetState( void ) const;
  std::optional< TaskIdentifier > ActiveTaskID( void ) const;
  std::optional< LifecycleEvent::ExitReason > GetExitReason( void ) const;
  bool IsFaulted( void ) const;
  bool IsPermanentlyFailed( void ) const;

  inline std::size_t QueueDepth( void ) const
  { return Inbox.Depth(); }

  inline Identifier GetID( void ) const
  { return ID; }

  // Supervision

  virtual std::string Name( void ) const override;
  virtual void Restart( void ) override;
  virtual void Abandon( void ) override;

  Worker( Identifier TheID, const std::string & TheName = std::string(),
          const Parameters & Settings = Parameters() );

  Worker( const Worker & Other ) = delete;
  Worker & operator = ( const Worker & Other ) = delete;

  virtual ~Worker();
};

std::string ToString( Worker::State TheState );

}      // Name space Taskforce
#endif // TASKFORCE_WORKER
