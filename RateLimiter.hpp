/*==============================================================================
Rate Limiter

The rate limiter admits at most a given number of requests within any time
window of the given length. It remembers the times of the admitted requests,
and a request is admitted only if fewer than the limit of the remembered times
are within the window ending now. There are no fixed intervals that are reset,
the window slides with time. Rejected requests are not remembered, and old
times are removed when the next request is tested.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_RATE_LIMITER
#define TASKFORCE_RATE_LIMITER

#include <chrono>                    // Time
#include <functional>                // The clock function
#include <mutex>                     // Protecting the window
#include <deque>                     // Admission times
#include <string>                    // Limiter name

namespace Taskforce
{

class RateLimiter
{
public:

  using Clock         = std::chrono::steady_clock;
  using ClockFunction = std::function< Clock::time_point( void ) >;

  class Parameters
  {
  public:

    std::size_t     Limit;
    Clock::duration Window;

    Parameters( std::size_t TheLimit = 100,
                Clock::duration TheWindow = std::chrono::seconds( 1 ) )
    : Limit( TheLimit ), Window( TheWindow )
    {}
  };

private:

  const Parameters    Settings;
  const ClockFunction Now;
  const std::string   LimiterName;

  mutable std::mutex              Guard;
  std::deque< Clock::time_point > Admitted;

public:

  bool Allow( void );

  // Admit throws Rate Limited if the request is not allowed

  void Admit( void );

  // The number of admissions currently within the window

  std::size_t Count( void );

  RateLimiter( const Parameters & TheSettings = Parameters(),
               ClockFunction TheClock = &Clock::now,
               const std::string & TheName = "RateLimiter" );

  RateLimiter( const RateLimiter & Other ) = delete;
  RateLimiter & operator = ( const RateLimiter & Other ) = delete;
};

}      // Name space Taskforce
#endif // TASKFORCE_RATE_LIMITER
