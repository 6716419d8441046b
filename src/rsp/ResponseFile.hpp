#ifndef HEADER_rsp_ResponseFile_hpp_ALREADY_INCLUDED
#define HEADER_rsp_ResponseFile_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rsp {

    // Flat `key=value` argument set. Only keys present in the file are set.
    struct ResponseFile
    {
        std::optional<std::string> output;
        // Comma-separated language identifiers, as typed
        std::optional<std::string> language;
        std::optional<bool> note;
        std::optional<std::string> sort;
        std::optional<bool> remove_empty_lines;

        ReturnCode parse(const std::string_view &content);
        std::string serialize() const;

        ReturnCode load(const std::filesystem::path &fp);
        ReturnCode save(const std::filesystem::path &fp) const;
    };

} // namespace rsp

#endif
