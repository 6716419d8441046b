#include <cli/Options.hpp>

#include <util/log.hpp>

#include <rubr/cli/Range.hpp>
#include <rubr/mss.hpp>

#include <sstream>

namespace cli {

    ReturnCode Options::parse(int argc, const char **argv)
    {
        MSS_BEGIN(ReturnCode);

        rubr::cli::Range r{argc, argv};

        MSS(r.pop(exe_name));

        for (std::string arg; r.pop(arg);)
        {
            auto is = [&](const char *sh, const char *lh) {
                return arg == sh || arg == lh;
            };
            auto pop_value = [&](std::optional<std::string> &dst) {
                MSS_BEGIN(bool);
                MSS(r.pop(dst.emplace()), util::log::error() << "Option '" << arg << "' expects a value" << std::endl);
                MSS_END();
            };
            auto pop_back = [&](std::vector<std::string> &dst) {
                MSS_BEGIN(bool);
                MSS(r.pop(dst.emplace_back()), util::log::error() << "Option '" << arg << "' expects a value" << std::endl);
                MSS_END();
            };

            if (false) {}
            else if (is("-h", "--help"))
                print_help = true;
            else if (is("-v", "--verbose"))
                ++verbosity;
            else if (is("-r", "--rsp-file"))
                MSS(pop_value(rsp_file));
            else if (is("-o", "--output"))
                MSS(pop_value(output));
            else if (is("-l", "--language"))
                MSS(pop_back(languages));
            else if (is("-n", "--note"))
                note = true;
            else if (is("-s", "--sort"))
                MSS(pop_value(sort));
            else if (is("-e", "--remove-empty-lines"))
                remove_empty_lines = true;
            else if (is("-x", "--restrict"))
                MSS(pop_back(restricted));
            else if (arg == "bundle")
                command = Command::Bundle;
            else if (arg == "create-rsp")
                command = Command::CreateRsp;
            else
                MSS(false, util::log::error() << "Unknown CLI argument '" << arg << "'" << std::endl);
        }

        MSS_END();
    }

    std::string Options::help() const
    {
        std::ostringstream oss;
        oss << "Help for '" << exe_name << "'" << std::endl;
        oss << exe_name << " Command Options" << std::endl;
        oss << "Command" << std::endl;
        oss << "    bundle        Bundle source files of the working directory into a single file" << std::endl;
        oss << "    create-rsp    Interactively create a response file for 'bundle'" << std::endl;
        oss << "Options" << std::endl;
        oss << "    -h  --help                 Print this help" << std::endl;
        oss << "    -v  --verbose              Print diagnostics" << std::endl;
        oss << "    -r  --rsp-file PATH        Read arguments from a response file" << std::endl;
        oss << "    -o  --output PATH          Bundle file to write" << std::endl;
        oss << "    -l  --language LANG[,...]  csharp python javascript java html css jsx angular or all" << std::endl;
        oss << "    -n  --note                 Precede each file with its origin" << std::endl;
        oss << "    -s  --sort name|type       Order by file name (default) or by extension" << std::endl;
        oss << "    -e  --remove-empty-lines   Drop empty and whitespace-only lines" << std::endl;
        oss << "    -x  --restrict PATTERN     Refuse to run in a directory containing PATTERN" << std::endl;
        return oss.str();
    }

} // namespace cli
