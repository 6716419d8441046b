#ifndef HEADER_bundle_Collector_hpp_ALREADY_INCLUDED
#define HEADER_bundle_Collector_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bundle {

    using Files = std::vector<std::filesystem::path>;

    class Collector
    {
    public:
        struct Config
        {
            std::filesystem::path root;
            // Lowercase, with leading '.'
            std::vector<std::string> extensions;
            // Never collected, typically the bundle output itself
            std::optional<std::filesystem::path> exclude;
        };

        Collector(const Config &config)
            : config_(config) {}

        // Appends absolute paths of all matching files under root, ordered by path
        ReturnCode collect(Files &files) const;

    private:
        bool matches_(const std::filesystem::path &fp) const;

        Config config_;
    };

} // namespace bundle

#endif
