/*==============================================================================
Supervisor

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <algorithm>                 // Minimum delay
#include <sstream>                   // Error messages
#include <stdexcept>                 // Standard exceptions

#include "Errors.hpp"
#include "Utility/ConsoleOutput.hpp"
#include "Supervisor.hpp"

namespace Taskforce
{

std::string ToString( Supervisor::Backoff Strategy )
{
  switch ( Strategy )
  {
    case Supervisor::Backoff::Constant:    return "constant";
    case Supervisor::Backoff::Linear:      return "linear";
    case Supervisor::Backoff::Exponential: return "exponential";
  }

  return "unknown";
}

// The exponential delay is doubled step by step so that it stops growing once
// it has passed the maximum delay.

Supervisor::Clock::duration
Supervisor::RestartDelay( const Parameters & Policy, unsigned int PriorRestarts )
{
  Clock::duration Delay( Policy.BaseDelay );

  switch ( Policy.Strategy )
  {
    case Backoff::Constant:
      break;
    case Backoff::Linear:
      Delay = Policy.BaseDelay * ( PriorRestarts + 1 );
      break;
    case Backoff::Exponential:
      for ( unsigned int k = 0; k < PriorRestarts && Delay < Policy.MaxDelay; k++ )
        Delay *= 2;
      break;
  }

  return std::min( Delay, Policy.MaxDelay );
}

/*==============================================================================

 Constructor and destructor

==============================================================================*/

Supervisor::Supervisor( const std::string & TheName,
                        const Parameters & ThePolicy )
: SupervisedEntity(), LifecycleObserver(),
  SupervisorName( TheName ), Policy( ThePolicy ),
  QueueGuard(), QueueChanged(), Events(), ScheduledRestarts(), Managed(),
  Running( true ), EventLoop()
{
  EventLoop = std::thread( &Supervisor::ProcessEvents, this );
}

Supervisor::~Supervisor()
{
  Stop();
}

/*==============================================================================

 Managing entities

==============================================================================*/

void Supervisor::Manage( SupervisedEntity & TheEntity )
{
  std::string EntityName = TheEntity.Name();

  {
    std::lock_guard< std::mutex > Lock( QueueGuard );

    if ( !Running )
      throw std::logic_error( LocatedMessage(
        SupervisorName + " is stopped and cannot manage " + EntityName,
        std::source_location::current() ) );

    if ( Managed.find( EntityName ) != Managed.end() )
      throw std::invalid_argument( LocatedMessage(
        SupervisorName + " already manages an entity called " + EntityName,
        std::source_location::current() ) );

    Managed.emplace( EntityName, Record( &TheEntity ) );
  }

  TheEntity.Subscribe( *this );

  ConsoleOutput( ConsoleOutput::Severity::Debug, SupervisorName )
    << "Managing " << EntityName << std::endl;
}

void Supervisor::Release( const std::string & EntityName )
{
  SupervisedEntity * TheEntity;

  {
    std::lock_guard< std::mutex > Lock( QueueGuard );

    auto Entry = Managed.find( EntityName );

    if ( Entry == Managed.end() )
      throw std::invalid_argument( LocatedMessage(
        SupervisorName + " does not manage " + EntityName,
        std::source_location::current() ) );

    TheEntity = Entry->second.Entity;
    Managed.erase( Entry );

    for ( auto Scheduled = ScheduledRestarts.begin();
          Scheduled != ScheduledRestarts.end(); )
      if ( Scheduled->second == EntityName )
        Scheduled = ScheduledRestarts.erase( Scheduled );
      else
        ++Scheduled;
  }

  TheEntity->Unsubscribe( *this );
}

std::vector< std::string > Supervisor::PermanentFailures( void )
{
  std::lock_guard< std::mutex > Lock( QueueGuard );
  std::vector< std::string > Failed;

  for ( const auto & [ EntityName, TheRecord ] : Managed )
    if ( TheRecord.PermanentlyFailed )
      Failed.push_back( EntityName );

  return Failed;
}

unsigned int Supervisor::RestartCount( const std::string & EntityName )
{
  std::lock_guard< std::mutex > Lock( QueueGuard );

  auto Entry = Managed.find( EntityName );

  if ( Entry == Managed.end() )
    throw std::invalid_argument( LocatedMessage(
      SupervisorName + " does not manage " + EntityName,
      std::source_location::current() ) );

  return Entry->second.TotalRestarts;
}

bool Supervisor::IsManaged( const std::string & EntityName )
{
  std::lock_guard< std::mutex > Lock( QueueGuard );
  return Managed.find( EntityName ) != Managed.end();
}

void Supervisor::Stop( void )
{
  std::vector< SupervisedEntity * > Entities;

  {
    std::lock_guard< std::mutex > Lock( QueueGuard );

    if ( !Running ) return;

    Running = false;
    ScheduledRestarts.clear();

    for ( auto & [ EntityName, TheRecord ] : Managed )
      Entities.push_back( TheRecord.Entity );
  }

  QueueChanged.notify_all();

  if ( EventLoop.joinable() )
    EventLoop.join();

  for ( SupervisedEntity * TheEntity : Entities )
    TheEntity->Unsubscribe( *this );

  Emit( LifecycleEvent::Exited( SupervisorName,
                                LifecycleEvent::ExitReason::Requested ) );
}

/*==============================================================================

 Event processing

==============================================================================*/

void Supervisor::Notify( const LifecycleEvent & TheEvent )
{
  std::lock_guard< std::mutex > Lock( QueueGuard );

  if ( Running )
  {
    Events.push_back( TheEvent );
    QueueChanged.notify_one();
  }
}

// Events are handled before restarts that are due. The time of the first
// scheduled restart is copied before the wait since the schedule may change
// while the thread waits.

void Supervisor::ProcessEvents( void )
{
  std::unique_lock< std::mutex > Lock( QueueGuard );

  while ( Running )
  {
    if ( !Events.empty() )
    {
      LifecycleEvent Next( Events.front() );
      Events.pop_front();

      Lock.unlock();
      HandleEvent( Next );
      Lock.lock();
    }
    else if ( ScheduledRestarts.empty() )
      QueueChanged.wait( Lock );
    else
    {
      Clock::time_point Due = ScheduledRestarts.begin()->first;

      if ( Due <= Clock::now() )
      {
        std::string EntityName = ScheduledRestarts.begin()->second;
        ScheduledRestarts.erase( ScheduledRestarts.begin() );

        Lock.unlock();
        PerformRestart( EntityName );
        Lock.lock();
      }
      else
        QueueChanged.wait_until( Lock, Due );
    }
  }
}

void Supervisor::HandleEvent( const LifecycleEvent & TheEvent )
{
  switch ( TheEvent.What )
  {
    case LifecycleEvent::Kind::Started:
      ConsoleOutput( ConsoleOutput::Severity::Debug, SupervisorName )
        << TheEvent << std::endl;
      break;
    case LifecycleEvent::Kind::Completed:
      ConsoleOutput( ConsoleOutput::Severity::Trace, SupervisorName )
        << TheEvent << std::endl;
      break;
    case LifecycleEvent::Kind::Error:
      ConsoleOutput( ConsoleOutput::Severity::Warning, SupervisorName )
        << TheEvent << std::endl;
      break;
    case LifecycleEvent::Kind::Exited:
      if ( TheEvent.IsFault() )
        HandleFault( TheEvent.Source, TheEvent.Details );
      else
        ConsoleOutput( ConsoleOutput::Severity::Information, SupervisorName )
          << TheEvent << std::endl;
      break;
  }
}

// The restart times older than the window are forgotten before the budget is
// tested. The restart time is recorded when the restart is scheduled so that
// a second fault arriving before the restart is performed is counted.

void Supervisor::HandleFault( const std::string & EntityName,
                              const std::string & Details )
{
  SupervisedEntity * GivenUp = nullptr;
  std::ostringstream Explanation;

  {
    std::lock_guard< std::mutex > Lock( QueueGuard );

    auto Entry = Managed.find( EntityName );

    if ( Entry == Managed.end() )
    {
      ConsoleOutput( ConsoleOutput::Severity::Warning, SupervisorName )
        << "Fault reported by the unmanaged entity " << EntityName
        << std::endl;
      return;
    }

    Record & TheRecord = Entry->second;

    if ( TheRecord.PermanentlyFailed ) return;

    Clock::time_point Now = Clock::now();

    while ( !TheRecord.Restarts.empty() &&
            Now - TheRecord.Restarts.front() > Policy.Window )
      TheRecord.Restarts.pop_front();

    if ( TheRecord.Restarts.size() < Policy.MaxRestarts )
    {
      Clock::duration Delay = RestartDelay( Policy, TheRecord.Restarts.size() );

      TheRecord.Restarts.push_back( Now );
      ScheduledRestarts.emplace( Now + Delay, EntityName );

      ConsoleOutput( ConsoleOutput::Severity::Information, SupervisorName )
        << EntityName << " failed (" << Details << "), restart "
        << TheRecord.Restarts.size() << " of " << Policy.MaxRestarts
        << " in " << std::chrono::duration_cast< std::chrono::milliseconds >(
                       Delay ).count() << " ms" << std::endl;
      return;
    }

    TheRecord.PermanentlyFailed = true;
    GivenUp = TheRecord.Entity;

    Explanation << EntityName << " failed more than " << Policy.MaxRestarts
                << " times within "
                << std::chrono::duration_cast< std::chrono::milliseconds >(
                     Policy.Window ).count() << " ms";
  }

  GivenUp->Abandon();

  ConsoleOutput( ConsoleOutput::Severity::Error, SupervisorName )
    << Explanation.str() << " and is given up" << std::endl;

  Emit( LifecycleEvent::Failed( SupervisorName,
                                ErrorKind::RestartBudgetExceeded,
                                Explanation.str() ) );
  Emit( LifecycleEvent::Exited( SupervisorName,
                                LifecycleEvent::ExitReason::Fault,
                                Explanation.str() ) );
}

// A restart that fails is handled as a new fault of the entity

void Supervisor::PerformRestart( const std::string & EntityName )
{
  SupervisedEntity * TheEntity = nullptr;

  {
    std::lock_guard< std::mutex > Lock( QueueGuard );

    auto Entry = Managed.find( EntityName );

    if ( Entry == Managed.end() || Entry->second.PermanentlyFailed )
      return;

    TheEntity = Entry->second.Entity;
    ++Entry->second.TotalRestarts;
  }

  try
  {
    TheEntity->Restart();

    ConsoleOutput( ConsoleOutput::Severity::Information, SupervisorName )
      << "Restarted " << EntityName << std::endl;
  }
  catch ( const std::exception & Failure )
  {
    ConsoleOutput( ConsoleOutput::Severity::Error, SupervisorName )
      << "Restarting " << EntityName << " failed: " << Failure.what()
      << std::endl;

    HandleFault( EntityName, Failure.what() );
  }
}

/*==============================================================================

 Supervision of the supervisor

==============================================================================*/

std::string Supervisor::Name( void ) const
{
  return SupervisorName;
}

// A restart by the parent gives the entities a fresh budget, and the entities
// that were given up are restarted. If one of them fails to restart, this is
// queued as a fault of that entity for the supervisor's own thread.

void Supervisor::Restart( void )
{
  std::vector< std::pair< std::string, SupervisedEntity * > > GivenUp;

  {
    std::lock_guard< std::mutex > Lock( QueueGuard );

    for ( auto & [ EntityName, TheRecord ] : Managed )
    {
      TheRecord.Restarts.clear();

      if ( TheRecord.PermanentlyFailed )
      {
        TheRecord.PermanentlyFailed = false;
        ++TheRecord.TotalRestarts;
        GivenUp.emplace_back( EntityName, TheRecord.Entity );
      }
    }
  }

  for ( auto & [ EntityName, TheEntity ] : GivenUp )
    try
    {
      TheEntity->Restart();
    }
    catch ( const std::exception & Failure )
    {
      Notify( LifecycleEvent::Exited( EntityName,
                                      LifecycleEvent::ExitReason::Fault,
                                      Failure.what() ) );
    }

  ConsoleOutput( ConsoleOutput::Severity::Information, SupervisorName )
    << "Restarted with " << GivenUp.size() << " entities revived" << std::endl;

  Emit( LifecycleEvent::Started( SupervisorName ) );
}

// Giving up the supervisor means giving up the entities waiting for a restart

void Supervisor::Abandon( void )
{
  std::vector< SupervisedEntity * > Pending;

  {
    std::lock_guard< std::mutex > Lock( QueueGuard );

    for ( auto & [ Due, EntityName ] : ScheduledRestarts )
    {
      auto Entry = Managed.find( EntityName );

      if ( Entry != Managed.end() && !Entry->second.PermanentlyFailed )
      {
        Entry->second.PermanentlyFailed = true;
        Pending.push_back( Entry->second.Entity );
      }
    }

    ScheduledRestarts.clear();
  }

  for ( SupervisedEntity * TheEntity : Pending )
    TheEntity->Abandon();

  ConsoleOutput( ConsoleOutput::Severity::Error, SupervisorName )
    << "Abandoned with " << Pending.size() << " pending restarts cancelled"
    << std::endl;
}

}  // Name space Taskforce
