#include <ReturnCode.hpp>

std::ostream &operator<<(std::ostream &os, ReturnCode rc)
{
    switch (rc)
    {
        case ReturnCode::Ok: os << "OK"; break;
        case ReturnCode::Error: os << "Something went wrong."; break;
        case ReturnCode::MissingOutput: os << "Output file is required."; break;
        case ReturnCode::RestrictedFolder: os << "Cannot run this command in restricted folders."; break;
        case ReturnCode::OutputDirMissing: os << "The specified output directory does not exist."; break;
        case ReturnCode::NoFilesFound: os << "No files matching the specified languages were found."; break;
        case ReturnCode::ReadFailed: os << "Could not read a source file."; break;
        case ReturnCode::WriteFailed: os << "Could not write the output file."; break;
        case ReturnCode::MalformedResponseFile: os << "The response file is malformed."; break;
    }
    return os;
}

void report(std::ostream &os, ReturnCode rc)
{
    switch (rc)
    {
        case ReturnCode::Ok: return;
        case ReturnCode::NoFilesFound: break;
        default: os << "Error: "; break;
    }
    os << rc << std::endl;
}
