#ifndef HEADER_cli_Options_hpp_ALREADY_INCLUDED
#define HEADER_cli_Options_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>

#include <string>
#include <optional>
#include <vector>

namespace cli {

    enum class Command{
        Bundle,
        CreateRsp,
    };

    class Options
    {
    public:
        std::string exe_name;

        bool print_help = false;
        int verbosity = 0;
        std::optional<Command> command;

        std::optional<std::string> rsp_file;
        std::optional<std::string> output;
        // Each entry may hold a comma-separated list
        std::vector<std::string> languages;
        bool note = false;
        std::optional<std::string> sort;
        bool remove_empty_lines = false;
        std::vector<std::string> restricted;

        ReturnCode parse(int argc, const char **argv);

        std::string help() const;
    };

} // namespace cli

#endif
