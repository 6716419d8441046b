#ifndef HEADER_cli_Config_hpp_ALREADY_INCLUDED
#define HEADER_cli_Config_hpp_ALREADY_INCLUDED

#include <bundle/Bundler.hpp>
#include <cli/Options.hpp>

#include <ReturnCode.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace cli {

    // Bundle arguments after merging defaults, CLI flags and the response file
    struct Config
    {
        std::filesystem::path root;
        std::filesystem::path output;
        std::vector<std::string> languages;
        bool note = false;
        bundle::Sort sort = bundle::Sort::Name;
        bool remove_empty_lines = false;

        // Case-insensitive patterns the working directory may not contain
        std::vector<std::string> restricted = {"bin", "debug"};

        ReturnCode init(const Options &options, const std::filesystem::path &cwd);
    };

} // namespace cli

#endif
