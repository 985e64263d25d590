/*=============================================================================
  Console Output

  The console output class defines the shared severity threshold, and the
  conversion of severities to and from their names.

  Author: Geir Horn, University of Oslo
  Contact: Geir.Horn [at] mn.uio.no
  License: LGPL3.0
=============================================================================*/

#include <algorithm>                        // To lower case names
#include <cctype>                           // Character conversion

#include "Errors.hpp"
#include "Utility/ConsoleOutput.hpp"

namespace Taskforce
{

// Information is shown by default, trace and debug records are not.

std::atomic< ConsoleOutput::Severity >
  ConsoleOutput::Threshold( ConsoleOutput::Severity::Information );

std::string ConsoleOutput::ToString( Severity Level )
{
  switch ( Level )
  {
    case Severity::Trace:       return "trace";
    case Severity::Debug:       return "debug";
    case Severity::Information: return "info";
    case Severity::Warning:     return "warning";
    case Severity::Error:       return "error";
  }

  return "unknown";
}

ConsoleOutput::Severity ConsoleOutput::ToSeverity( const std::string & Name )
{
  std::string Level( Name );

  std::transform( Level.begin(), Level.end(), Level.begin(),
                  []( unsigned char c ){ return std::tolower( c ); } );

  if ( Level == "trace" )       return Severity::Trace;
  if ( Level == "debug" )       return Severity::Debug;
  if ( Level == "info" || Level == "information" )
                                return Severity::Information;
  if ( Level == "warning" )     return Severity::Warning;
  if ( Level == "error" )       return Severity::Error;

  throw ConfigurationError( "Unknown log severity \"" + Name + "\"" );
}

// The prefix is written only if the record will be shown. Otherwise the bad
// bit makes every subsequent output operation a no-op.

ConsoleOutput::ConsoleOutput( Severity Level, const std::string & Source )
: std::osyncstream( std::clog )
{
  if ( Enabled( Level ) )
  {
    *this << "[" << ToString( Level ) << "] ";

    if ( !Source.empty() )
      *this << Source << ": ";
  }
  else
    setstate( std::ios_base::badbit );
}

}  // End name space Taskforce
