/*=============================================================================
Console Output

The workers, the pools and the supervisors all run in their own threads and
writing diagnostics directly to a standard stream would interleave the output
of different threads into garbage. The console output is a synchronised output
stream: everything written to one console output object is collected and
transferred to the console in one operation when the object is destroyed.
Hence, a console output object should be created for each record written, and
it is typically a temporary:

  ConsoleOutput( ConsoleOutput::Severity::Warning, Name() )
    << "Mailbox is full" << std::endl;

Each record is prefixed with its severity and the name of the entity writing
it. Records with a severity below the global threshold are discarded without
being formatted, which is done by putting the stream in the bad state so that
all output operators return immediately.

Diagnostics go to the standard log stream so that they do not mix with the
results a programme prints on the standard output.

Author and Copyright: Geir Horn, University of Oslo
Contact: Geir.Horn@mn.uio.no
License: LGPL 3.0 (https://www.gnu.org/licenses/lgpl-3.0.en.html)

Revisions:
  Severity levels and a global threshold added to the console output
  The deprecated console print server removed
=============================================================================*/

#ifndef TASKFORCE_CONSOLE_OUTPUT
#define TASKFORCE_CONSOLE_OUTPUT

#include <string>                           // Standard strings
#include <iostream>                         // The standard log stream
#include <atomic>                           // The shared threshold
#include <syncstream>                       // Synchronised output

namespace Taskforce
{

class ConsoleOutput
: public std::osyncstream
{
public:

  enum class Severity
  {
    Trace,
    Debug,
    Information,
    Warning,
    Error
  };

private:

  static std::atomic< Severity > Threshold;

public:

  inline static void SetThreshold( Severity Level )
  { Threshold.store( Level ); }

  inline static Severity GetThreshold( void )
  { return Threshold.load(); }

  inline static bool Enabled( Severity Level )
  { return Level >= Threshold.load(); }

  // The severity names are used both for the prefix and for reading the
  // threshold from the configuration. An unknown name will throw a
  // configuration error.

  static std::string ToString( Severity Level );
  static Severity    ToSeverity( const std::string & Name );

  ConsoleOutput( Severity Level = Severity::Information,
                 const std::string & Source = std::string() );
};

}       // End name space Taskforce
#endif  // TASKFORCE_CONSOLE_OUTPUT
