/*==============================================================================
Worker Pool

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <algorithm>                 // Sorting candidates
#include <numeric>                   // Candidate indices
#include <sstream>                   // Error messages
#include <stdexcept>                 // Standard exceptions

#include "Errors.hpp"
#include "Utility/ConsoleOutput.hpp"
#include "WorkerPool.hpp"

namespace Taskforce
{

/*==============================================================================

 Outcome recorder

==============================================================================*/
//
// An abandoned task never produced a result. It is recorded as a failure since
// the breaker would otherwise wait forever for the outcome of a probe.

void WorkerPool::OutcomeRecorder::Deliver( const Result & TheResult )
{
  if ( TheResult.IsSuccess() )
    Breaker->RecordSuccess( Admission );
  else
    Breaker->RecordFailure( Admission );

  if ( Next )
    Next->Deliver( TheResult );
}

void WorkerPool::OutcomeRecorder::Abandon( TaskIdentifier TheTask )
{
  Breaker->RecordFailure( Admission );

  if ( Next )
    Next->Abandon( TheTask );
}

/*==============================================================================

 Constructor and destructor

==============================================================================*/

WorkerPool::WorkerPool( const std::string & TheName,
                        const Parameters & TheSettings,
                        std::shared_ptr< RateLimiter > TheLimiter,
                        std::shared_ptr< CircuitBreaker > TheBreaker )
: SupervisedEntity(), LifecycleObserver(),
  PoolName( TheName ), Settings( TheSettings ),
  Limiter( std::move( TheLimiter ) ), Breaker( std::move( TheBreaker ) ),
  PoolGuard(), Workers(), Cursor( 0 ), Closed( false )
{
  std::lock_guard< std::mutex > Lock( PoolGuard );

  for ( std::size_t i = 0; i < Settings.Workers; i++ )
    AddWorker();

  ConsoleOutput( ConsoleOutput::Severity::Debug, PoolName )
    << "Created with " << Workers.size() << " workers" << std::endl;
}

// The workers must be destroyed while the pool is still able to receive their
// events, and they are therefore shut down and removed explicitly.

WorkerPool::~WorkerPool()
{
  Shutdown();

  std::lock_guard< std::mutex > Lock( PoolGuard );

  for ( auto & TheWorker : Workers )
    TheWorker->Unsubscribe( *this );

  Workers.clear();
}

void WorkerPool::AddWorker( void )
{
  Worker::Identifier NewID = Workers.size();

  auto NewWorker = std::make_shared< Worker >(
    NewID, PoolName + ".Worker" + std::to_string( NewID ),
    Settings.WorkerSettings );

  NewWorker->Subscribe( *this );
  Workers.push_back( std::move( NewWorker ) );
}

/*==============================================================================

 Routing

==============================================================================*/
//
// The candidates are the worker indices in the order they should be tried.
// The round robin cursor moves one position for every submission regardless
// of which worker finally accepts the task.

std::vector< std::size_t > WorkerPool::Candidates( void )
{
  std::vector< std::size_t > Order( Workers.size() );

  switch ( Settings.Policy )
  {
    case Selection::RoundRobin:
    {
      std::size_t Start = Cursor % Workers.size();

      Cursor = ( Start + 1 ) % Workers.size();

      for ( std::size_t i = 0; i < Workers.size(); i++ )
        Order[ i ] = ( Start + i ) % Workers.size();

      break;
    }
    case Selection::LeastLoaded:
    {
      std::vector< std::size_t > Depth( Workers.size() );

      for ( std::size_t i = 0; i < Workers.size(); i++ )
        Depth[ i ] = Workers[ i ]->QueueDepth();

      std::iota( Order.begin(), Order.end(), 0 );
      std::stable_sort( Order.begin(), Order.end(),
                        [&Depth]( std::size_t First, std::size_t Second ){
                          return Depth[ First ] < Depth[ Second ]; });
      break;
    }
  }

  return Order;
}

bool WorkerPool::Contains( const std::shared_ptr< Worker > & TheWorker ) const
{
  return std::find( Workers.begin(), Workers.end(), TheWorker )
         != Workers.end();
}

// The candidates are taken under the lock, but the task is given to a worker
// without holding the lock. A candidate refusing the task may have been
// removed by a concurrent resize, or the pool may have been shut down, and
// then the selection is made again among the workers of the pool. Only a
// terminated worker still in the pool is subject to the terminated policy.

std::shared_ptr< ResultHandle > WorkerPool::Route( const Task & TheTask )
{
  while ( true )
  {
    std::vector< std::shared_ptr< Worker > > Selected;

    {
      std::lock_guard< std::mutex > Lock( PoolGuard );

      if ( Closed )
        throw NoAvailableWorker( PoolName + " has been shut down" );

      if ( Workers.empty() )
        throw NoAvailableWorker( PoolName + " has no workers" );

      for ( std::size_t Index : Candidates() )
        Selected.push_back( Workers[ Index ] );
    }

    bool Reselect = false;

    for ( const auto & Candidate : Selected )
    {
      if ( Candidate->GetState() != Worker::State::Terminated )
        try
        {
          return Candidate->Submit( TheTask );
        }
        catch ( const WorkerTerminated & Refused )
        {
          ConsoleOutput( ConsoleOutput::Severity::Debug, PoolName )
            << Refused.what() << std::endl;
        }

      {
        std::lock_guard< std::mutex > Lock( PoolGuard );
        Reselect = Closed || !Contains( Candidate );
      }

      if ( Reselect )
        break;

      if ( Settings.WhenTerminated == OnTerminated::Fail )
        throw NoAvailableWorker( Candidate->Name() + " selected for task "
                                 + std::to_string( TheTask.ID )
                                 + " has terminated" );
    }

    if ( !Reselect )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << "All " << Selected.size() << " workers of " << PoolName
                   << " have terminated, task " << TheTask.ID
                   << " is rejected";

      throw NoAvailableWorker( ErrorMessage.str() );
    }
  }
}

// The limiter is asked before the breaker so that a rejected request does not
// consume the breaker's probe. If the breaker admitted the task but it could
// not be routed, the failure is recorded to release a reserved probe.

std::shared_ptr< ResultHandle > WorkerPool::Submit( const Task & TheTask )
{
  if ( Limiter )
    Limiter->Admit();

  if ( !Breaker )
    return Route( TheTask );

  CircuitBreaker::Ticket Admission = Breaker->Admit();

  try
  {
    return Route( Task( TheTask,
                        std::make_shared< OutcomeRecorder >( Breaker, Admission,
                                                             TheTask.ReplyTo ) ) );
  }
  catch ( const Error & Refused )
  {
    Breaker->RecordFailure( Admission );
    throw;
  }
}

/*==============================================================================

 Size and shut down

==============================================================================*/

void WorkerPool::Resize( std::size_t NewSize )
{
  std::vector< std::shared_ptr< Worker > > Removed;

  {
    std::lock_guard< std::mutex > Lock( PoolGuard );

    if ( Closed )
      throw NoAvailableWorker( PoolName + " has been shut down and cannot be "
                               "resized" );

    while ( Workers.size() < NewSize )
      AddWorker();

    while ( Workers.size() > NewSize )
    {
      Removed.push_back( std::move( Workers.back() ) );
      Workers.pop_back();
    }

    Settings.Workers = NewSize;
    Cursor = Workers.empty() ? 0 : Cursor % Workers.size();
  }

  // Removed workers are no longer part of the pool and their exit must not be
  // reported as an exit of the pool.

  for ( auto & Retired : Removed )
  {
    Retired->Unsubscribe( *this );

    if ( Settings.WhenRemoved == DrainPolicy::Drain )
      Retired->ShutdownGraceful();
    else
      Retired->Stop();
  }

  ConsoleOutput( ConsoleOutput::Severity::Information, PoolName )
    << "Resized to " << NewSize << " workers, " << Removed.size()
    << " removed" << std::endl;

  Removed.clear();
}

// The set of workers cannot change once the pool is closed, and the workers
// can therefore be waited for without holding the lock.

void WorkerPool::Shutdown( void )
{
  std::vector< Worker * > Running;

  {
    std::lock_guard< std::mutex > Lock( PoolGuard );

    Closed = true;

    for ( auto & TheWorker : Workers )
      Running.push_back( TheWorker.get() );
  }

  for ( Worker * TheWorker : Running )
    TheWorker->ShutdownGraceful();

  for ( Worker * TheWorker : Running )
    TheWorker->AwaitTermination();
}

std::size_t WorkerPool::Size( void ) const
{
  std::lock_guard< std::mutex > Lock( PoolGuard );
  return Workers.size();
}

const Worker & WorkerPool::GetWorker( std::size_t Index ) const
{
  std::lock_guard< std::mutex > Lock( PoolGuard );

  if ( Index >= Workers.size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << PoolName << " has " << Workers.size()
                 << " workers and worker " << Index << " does not exist";

    throw std::out_of_range( LocatedMessage( ErrorMessage.str(),
                             std::source_location::current() ) );
  }

  return *Workers[ Index ];
}

bool WorkerPool::IsShutDown( void ) const
{
  std::lock_guard< std::mutex > Lock( PoolGuard );
  return Closed;
}

/*==============================================================================

 Supervision

==============================================================================*/

void WorkerPool::Notify( const LifecycleEvent & TheEvent )
{
  LifecycleEvent Forwarded( TheEvent );

  Forwarded.Source  = PoolName;
  Forwarded.Details = TheEvent.Details.empty() ? TheEvent.Source
                      : TheEvent.Source + ": " + TheEvent.Details;

  Emit( Forwarded );
}

std::string WorkerPool::Name( void ) const
{
  return PoolName;
}

// Restarting a worker joins its old Postman, and abandoning it delivers the
// failures of its pending tasks. Both are done without holding the pool lock
// since a reply target may call back into the pool.

std::vector< std::shared_ptr< Worker > > WorkerPool::Faulted( void ) const
{
  std::lock_guard< std::mutex > Lock( PoolGuard );
  std::vector< std::shared_ptr< Worker > > Failed;

  for ( const auto & TheWorker : Workers )
    if ( TheWorker->IsFaulted() )
      Failed.push_back( TheWorker );

  return Failed;
}

void WorkerPool::Restart( void )
{
  for ( const auto & TheWorker : Faulted() )
    TheWorker->Restart();
}

void WorkerPool::Abandon( void )
{
  for ( const auto & TheWorker : Faulted() )
    TheWorker->Abandon();
}

}  // Name space Taskforce
