#include <cli/App.hpp>

#include <util/log.hpp>

#include <rubr/mss.hpp>

#include <iostream>

namespace cli {
    ReturnCode main(int argc, const char **argv)
    {
        MSS_BEGIN(ReturnCode);

        cli::Options options;
        MSS(options.parse(argc, argv), std::cerr << "Could not parse CLI options" << std::endl);

        util::log::set_level(options.verbosity);

        if (options.print_help)
        {
            std::cout << options.help();
            MSS_RETURN_OK();
        }

        cli::App app{options};
        MSS(app.run());

        MSS_END();
    }

} // namespace cli

int main(int argc, const char **argv)
{
    const auto rc = cli::main(argc, argv);
    if (rc != ReturnCode::Ok)
    {
        report(std::cout, rc);
        return static_cast<int>(rc);
    }

    return 0;
}
