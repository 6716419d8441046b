#ifndef HEADER_bundle_Bundler_hpp_ALREADY_INCLUDED
#define HEADER_bundle_Bundler_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>
#include <bundle/Collector.hpp>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace bundle {

    enum class Sort
    {
        Name,
        Type,
    };

    std::ostream &operator<<(std::ostream &os, Sort sort);

    std::optional<Sort> parse_sort(const std::string_view &name);

    // Stable: files that compare equal keep their relative order
    void sort(Files &files, Sort sort);

    class Bundler
    {
    public:
        struct Config
        {
            bool note = false;
            bool remove_empty_lines = false;
            Sort sort = Sort::Name;
        };

        static constexpr const char *Separator = "####";

        Bundler(const Config &config)
            : config_(config) {}

        // Reads all files before `output` is opened: a failing read leaves no output behind
        ReturnCode bundle(const std::filesystem::path &output, Files files) const;

        void write(std::ostream &os, const std::filesystem::path &fp, const std::string_view &content) const;

    private:
        Config config_;
    };

} // namespace bundle

#endif
