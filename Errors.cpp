/*==============================================================================
Errors

Author and Copyright: Geir Horn, University of Oslo
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)
==============================================================================*/

#include "Errors.hpp"

namespace Taskforce
{

std::string ToString( ErrorKind Kind )
{
  switch ( Kind )
  {
    case ErrorKind::TaskExecutionFailure:  return "TaskExecutionFailure";
    case ErrorKind::WorkerFatalFault:      return "WorkerFatalFault";
    case ErrorKind::MailboxFull:           return "MailboxFull";
    case ErrorKind::WorkerTerminated:      return "WorkerTerminated";
    case ErrorKind::NoAvailableWorker:     return "NoAvailableWorker";
    case ErrorKind::CircuitOpen:           return "CircuitOpen";
    case ErrorKind::RateLimited:           return "RateLimited";
    case ErrorKind::RestartBudgetExceeded: return "RestartBudgetExceeded";
  }

  return "UnknownError";
}

std::ostream & operator << ( std::ostream & Output, ErrorKind Kind )
{
  return Output << ToString( Kind );
}

std::string LocatedMessage( const std::string & Explanation,
                            const std::source_location & Location )
{
  std::ostringstream ErrorMessage;

  ErrorMessage << Location.file_name() << " at line " << Location.line()
               << " in function " << Location.function_name() << ": "
               << Explanation;

  return ErrorMessage.str();
}

// The location is passed on so that the error appears to be thrown where the
// kind was decided, and not from this function.

void Raise( ErrorKind Kind, const std::string & Explanation,
            const std::source_location & Location )
{
  switch ( Kind )
  {
    case ErrorKind::TaskExecutionFailure:
      throw TaskExecutionFailure( Explanation, Location );
    case ErrorKind::WorkerFatalFault:
      throw WorkerFatalFault( Explanation, Location );
    case ErrorKind::MailboxFull:
      throw MailboxFull( Explanation, Location );
    case ErrorKind::WorkerTerminated:
      throw WorkerTerminated( Explanation, Location );
    case ErrorKind::NoAvailableWorker:
      throw NoAvailableWorker( Explanation, Location );
    case ErrorKind::CircuitOpen:
      throw CircuitOpen( Explanation, Location );
    case ErrorKind::RateLimited:
      throw RateLimited( Explanation, Location );
    case ErrorKind::RestartBudgetExceeded:
      throw RestartBudgetExceeded( Explanation, Location );
  }

  throw Error( Kind, Explanation, Location );
}

}  // Name space Taskforce
