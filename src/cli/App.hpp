#ifndef HEADER_cli_App_hpp_ALREADY_INCLUDED
#define HEADER_cli_App_hpp_ALREADY_INCLUDED

#include <cli/Options.hpp>
#include <cli/Config.hpp>

#include <filesystem>
#include <istream>
#include <ostream>

namespace cli {

    class App
    {
    public:
        App(const Options &options)
            : options_(options) {}

        // Config::restricted can be adjusted before running
        Config &config() { return config_; }

        // Runs in the process working directory, prompting on std::cin/std::cout
        ReturnCode run();
        ReturnCode run(const std::filesystem::path &cwd, std::istream &is, std::ostream &os);

    private:
        ReturnCode bundle_(const std::filesystem::path &cwd, std::ostream &os);
        ReturnCode create_rsp_(const std::filesystem::path &cwd, std::istream &is, std::ostream &os) const;

        const Options &options_;
        Config config_;
    };

} // namespace cli

#endif
