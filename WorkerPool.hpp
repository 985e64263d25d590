/*==============================================================================
Worker Pool

The worker pool distributes tasks over a set of workers it owns. The workers
are numbered from zero in the order they are created, and a task is given to
exactly one worker selected by the pool's selection policy:

RoundRobin:  The workers are used in turn, cycling over the worker numbers.
LeastLoaded: The worker with the smallest queue depth, that is the pending
             tasks plus the one in progress, is used. Ties are broken in favour
             of the worker with the lowest number.

If the selected worker has terminated, the pool will either fail the
submission with No Available Worker, or retry the selection among the other
workers, depending on the terminated policy. A task is never silently dropped:
it is either accepted by a worker or the submission throws.

Before a task is routed, the pool may ask a rate limiter and then a circuit
breaker for admission. When a circuit breaker is used, the outcome of every
routed task is recorded in the breaker with the task's admission ticket when
the result arrives, so that a failing pool will eventually stop admitting
tasks. The outcome is recorded before the result handle becomes ready, and
also if the submitter has cancelled the handle.

The pool lock only protects the set of workers. A submission selects the
candidate workers under the lock, but it gives the task to a worker after the
lock is released since the worker's mailbox may block the submitter until
there is room for the task.

The pool is itself a supervised entity. The lifecycle events of its workers are
passed on with the pool as the source, so a supervisor managing the pool will
restart the pool when one of its workers fails, and restarting the pool means
restarting its failed workers.

The pool can be resized while it is running. New workers are added with the
next numbers, and workers are removed from the highest number down. A removed
worker will either complete its pending tasks or be stopped, depending on the
drain policy. A pool that has been shut down does not accept new tasks.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_WORKER_POOL
#define TASKFORCE_WORKER_POOL

#include <memory>                    // Owned workers
#include <vector>                    // The workers
#include <mutex>                     // Protecting the pool
#include <string>                    // Pool name

#include "Task.hpp"
#include "Lifecycle.hpp"
#include "Worker.hpp"
#include "CircuitBreaker.hpp"
#include "RateLimiter.hpp"

namespace Taskforce
{

class WorkerPool : public SupervisedEntity, public LifecycleObserver
{
public:

  enum class Selection
  {
    RoundRobin,
    LeastLoaded
  };

  enum class OnTerminated
  {
    Fail,
    Retry
  };

  enum class DrainPolicy
  {
    Drain,
    Stop
  };

  class Parameters
  {
  public:

    std::size_t        Workers;
    Selection          Policy;
    OnTerminated       WhenTerminated;
    DrainPolicy        WhenRemoved;
    Worker::Parameters WorkerSettings;

    Parameters( std::size_t TheWorkers = 4,
                Selection TheSelection = Selection::RoundRobin,
                OnTerminated TheTerminatedPolicy = OnTerminated::Retry,
                DrainPolicy TheDrainPolicy = DrainPolicy::Drain,
                const Worker::Parameters & TheWorkerSettings
                  = Worker::Parameters() )
    : Workers( TheWorkers ), Policy( TheSelection ),
      WhenTerminated( TheTerminatedPolicy ), WhenRemoved( TheDrainPolicy ),
      WorkerSettings( TheWorkerSettings )
    {}
  };

private:

  const std::string PoolName;
  Parameters        Settings;

  std::shared_ptr< RateLimiter >    Limiter;
  std::shared_ptr< CircuitBreaker > Breaker;

  mutable std::mutex                     PoolGuard;
  std::vector< std::shared_ptr< Worker > > Workers;
  std::size_t                            Cursor;
  bool                                   Closed;

  // The outcome recorder sits between the worker and the task's own reply
  // target and records each result in the circuit breaker.

  class OutcomeRecorder : public ReplyTarget
  {
  private:

    std::shared_ptr< CircuitBreaker > Breaker;
    CircuitBreaker::Ticket            Admission;
    std::shared_ptr< ReplyTarget >    Next;

  public:

    virtual void Deliver( const Result & TheResult ) override;
    virtual void Abandon( TaskIdentifier TheTask ) override;

    OutcomeRecorder( std::shared_ptr< CircuitBreaker > TheBreaker,
                     const CircuitBreaker::Ticket & TheAdmission,
                     std::shared_ptr< ReplyTarget > TheNext )
    : ReplyTarget(), Breaker( std::move( TheBreaker ) ),
      Admission( TheAdmission ), Next( std::move( TheNext ) )
    {}
  };

  // Utility functions that must be called with the pool lock held

  void AddWorker( void );
  std::vector< std::size_t > Candidates( void );
  bool Contains( const std::shared_ptr< Worker > & TheWorker ) const;

  // These take the lock themselves. Routing releases it before the task is
  // given to the selected worker.

  std::vector< std::shared_ptr< Worker > > Faulted( void ) const;
  std::shared_ptr< ResultHandle > Route( const Task & TheTask );

public:

  std::shared_ptr< ResultHandle > Submit( const Task & TheTask );

  void Resize( std::size_t NewSize );
  void Shutdown( void );

  std::size_t Size( void ) const;
  const Worker & GetWorker( std::size_t Index ) const;
  bool IsShutDown( void ) const;

  inline std::shared_ptr< CircuitBreaker > GetBreaker( void ) const
  { return Breaker; }

  inline std::shared_ptr< RateLimiter > GetLimiter( void ) const
  { return Limiter; }

  // Events from the workers are passed on with the pool as source

  virtual void Notify( const LifecycleEvent & TheEvent ) override;

  virtual std::string Name( void ) const override;
  virtual void Restart( void ) override;
  virtual void Abandon( void ) override;

  WorkerPool( const std::string & TheName,
              const Parameters & TheSettings = Parameters(),
              std::shared_ptr< RateLimiter > TheLimiter = nullptr,
              std::shared_ptr< CircuitBreaker > TheBreaker = nullptr );

  WorkerPool( const WorkerPool & Other ) = delete;
  WorkerPool & operator = ( const WorkerPool & Other ) = delete;

  virtual ~WorkerPool();
};

}      // Name space Taskforce
#endif // TASKFORCE_WORKER_POOL
