/*==============================================================================
Rate Limiter

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include <sstream>                   // Error messages
#include <stdexcept>                 // Standard exceptions

#include "Errors.hpp"
#include "Utility/ConsoleOutput.hpp"
#include "RateLimiter.hpp"

namespace Taskforce
{

RateLimiter::RateLimiter( const Parameters & TheSettings,
                          ClockFunction TheClock, const std::string & TheName )
: Settings( TheSettings ), Now( std::move( TheClock ) ), LimiterName( TheName ),
  Guard(), Admitted()
{
  if ( Settings.Limit == 0 || Settings.Window <= Clock::duration::zero() )
    throw std::invalid_argument( LocatedMessage(
      LimiterName + " needs a positive limit and window",
      std::source_location::current() ) );

  if ( !Now )
    throw std::invalid_argument( LocatedMessage(
      LimiterName + " has no clock", std::source_location::current() ) );
}

// A time stamp is inside the window if it is less than one window length old

bool RateLimiter::Allow( void )
{
  std::lock_guard< std::mutex > Lock( Guard );

  Clock::time_point Time = Now();

  while ( !Admitted.empty() && Time - Admitted.front() >= Settings.Window )
    Admitted.pop_front();

  if ( Admitted.size() < Settings.Limit )
  {
    Admitted.push_back( Time );
    return true;
  }

  return false;
}

void RateLimiter::Admit( void )
{
  if ( !Allow() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << LimiterName << " has admitted " << Settings.Limit
                 << " requests within the last "
                 << std::chrono::duration_cast< std::chrono::milliseconds >(
                      Settings.Window ).count()
                 << " ms";

    ConsoleOutput( ConsoleOutput::Severity::Debug, LimiterName )
      << "Request rejected" << std::endl;

    throw RateLimited( ErrorMessage.str() );
  }
}

std::size_t RateLimiter::Count( void )
{
  std::lock_guard< std::mutex > Lock( Guard );

  Clock::time_point Time = Now();

  while ( !Admitted.empty() && Time - Admitted.front() >= Settings.Window )
    Admitted.pop_front();

  return Admitted.size();
}

}  // Name space Taskforce
