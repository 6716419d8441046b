#ifndef HEADER_ReturnCode_hpp_ALREADY_INCLUDED
#define HEADER_ReturnCode_hpp_ALREADY_INCLUDED

#include <ostream>

// The numeric value doubles as the process exit status
enum class ReturnCode
{
    Ok = 0,
    Error,
    MissingOutput,
    RestrictedFolder,
    OutputDirMissing,
    NoFilesFound,
    ReadFailed,
    WriteFailed,
    MalformedResponseFile,
};

std::ostream &operator<<(std::ostream &os, ReturnCode rc);

// Status line for a finished run, empty for Ok. Only real failures get an "Error: " prefix.
void report(std::ostream &os, ReturnCode rc);

#endif
