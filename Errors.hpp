/*==============================================================================
Errors

The worker runtime reports errors as exceptions. Every error carries the place
where it was detected, formatted from the standard source location as
"file at line N in function F: explanation", so that an error escaping to
main() can be traced without a debugger.

Errors fall in two groups. The runtime errors of the worker taxonomy are all
derived from the Error class below, and they carry an Error Kind so that the
same classification can be used for failed task results and for the lifecycle
events observed by supervisors, where no exception object is propagated. The
second group is the logic errors caused by using the interfaces wrongly, like
resuming a worker with a token that does not match the one returned when the
worker was paused. These are derived from the standard logic error classes.

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#ifndef TASKFORCE_ERRORS
#define TASKFORCE_ERRORS

#include <string>                // Standard strings
#include <sstream>               // Formatted error messages
#include <ostream>               // Printing error kinds
#include <stdexcept>             // Standard exceptions
#include <source_location>       // Improved reporting of errors

namespace Taskforce
{

/*==============================================================================

 Error kinds

==============================================================================*/
//
// The kinds are the taxonomy of the runtime. Failure results and error events
// carry one of these to tell what went wrong.

enum class ErrorKind
{
  TaskExecutionFailure,
  WorkerFatalFault,
  MailboxFull,
  WorkerTerminated,
  NoAvailableWorker,
  CircuitOpen,
  RateLimited,
  RestartBudgetExceeded
};

std::string ToString( ErrorKind Kind );
std::ostream & operator << ( std::ostream & Output, ErrorKind Kind );

// The formatting of the location is shared by all error classes

std::string LocatedMessage( const std::string & Explanation,
                            const std::source_location & Location );

/*==============================================================================

 Runtime errors

==============================================================================*/

class Error : public std::runtime_error
{
public:

  const ErrorKind Kind;

  Error( ErrorKind TheKind, const std::string & Explanation,
         const std::source_location & Location
           = std::source_location::current() )
  : std::runtime_error( LocatedMessage( Explanation, Location ) ),
    Kind( TheKind )
  {}

  virtual ~Error() = default;
};

// The computation of a task failed. The worker reports this as a failure
// result and continues with the next task.

class TaskExecutionFailure : public Error
{
public:

  TaskExecutionFailure( const std::string & Explanation,
                        const std::source_location & Location
                          = std::source_location::current() )
  : Error( ErrorKind::TaskExecutionFailure, Explanation, Location )
  {}
};

// A computation throws the fatal fault when the execution context of the
// worker can no longer be trusted. The worker terminates and it is up to the
// supervisor to restart it.

class WorkerFatalFault : public Error
{
public:

  WorkerFatalFault( const std::string & Explanation,
                    const std::source_location & Location
                      = std::source_location::current() )
  : Error( ErrorKind::WorkerFatalFault, Explanation, Location )
  {}
};

class MailboxFull : public Error
{
public:

  MailboxFull( const std::string & Explanation,
               const std::source_location & Location
                 = std::source_location::current() )
  : Error( ErrorKind::MailboxFull, Explanation, Location )
  {}
};

class WorkerTerminated : public Error
{
public:

  WorkerTerminated( const std::string & Explanation,
                    const std::source_location & Location
                      = std::source_location::current() )
  : Error( ErrorKind::WorkerTerminated, Explanation, Location )
  {}
};

class NoAvailableWorker : public Error
{
public:

  NoAvailableWorker( const std::string & Explanation,
                     const std::source_location & Location
                       = std::source_location::current() )
  : Error( ErrorKind::NoAvailableWorker, Explanation, Location )
  {}
};

class CircuitOpen : public Error
{
public:

  CircuitOpen( const std::string & Explanation,
               const std::source_location & Location
                 = std::source_location::current() )
  : Error( ErrorKind::CircuitOpen, Explanation, Location )
  {}
};

class RateLimited : public Error
{
public:

  RateLimited( const std::string & Explanation,
               const std::source_location & Location
                 = std::source_location::current() )
  : Error( ErrorKind::RateLimited, Explanation, Location )
  {}
};

class RestartBudgetExceeded : public Error
{
public:

  RestartBudgetExceeded( const std::string & Explanation,
                         const std::source_location & Location
                           = std::source_location::current() )
  : Error( ErrorKind::RestartBudgetExceeded, Explanation, Location )
  {}
};

// When only the kind is known, for instance when the value of a failed result
// is requested, the matching exception is thrown by this function.

[[noreturn]] void Raise( ErrorKind Kind, const std::string & Explanation,
                         const std::source_location & Location
                           = std::source_location::current() );

/*==============================================================================

 Logic errors

==============================================================================*/

class InvalidResumeToken : public std::logic_error
{
public:

  InvalidResumeToken( const std::string & Explanation,
                      const std::source_location & Location
                        = std::source_location::current() )
  : std::logic_error( LocatedMessage( Explanation, Location ) )
  {}
};

class AlreadyPaused : public std::logic_error
{
public:

  AlreadyPaused( const std::string & Explanation,
                 const std::source_location & Location
                   = std::source_location::current() )
  : std::logic_error( LocatedMessage( Explanation, Location ) )
  {}
};

// The value of a result or the payload of a task is requested as a type it
// does not hold.

class PayloadTypeError : public std::invalid_argument
{
public:

  PayloadTypeError( const std::string & Explanation,
                    const std::source_location & Location
                      = std::source_location::current() )
  : std::invalid_argument( LocatedMessage( Explanation, Location ) )
  {}
};

class ConfigurationError : public std::invalid_argument
{
public:

  ConfigurationError( const std::string & Explanation,
                      const std::source_location & Location
                        = std::source_location::current() )
  : std::invalid_argument( LocatedMessage( Explanation, Location ) )
  {}
};

}      // Name space Taskforce
#endif // TASKFORCE_ERRORS
