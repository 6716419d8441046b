#ifndef HEADER_str_util_hpp_ALREADY_INCLUDED
#define HEADER_str_util_hpp_ALREADY_INCLUDED

#include <string>
#include <string_view>
#include <vector>

namespace str {

    std::string_view trim(const std::string_view &sv);

    std::string to_lower(const std::string_view &sv);

    bool iequals(const std::string_view &a, const std::string_view &b);

    // Case-insensitive substring search
    bool icontains(const std::string_view &haystack, const std::string_view &needle);

    // Empty or only whitespace, including the UTF-8 encoded Unicode spaces
    bool is_blank(const std::string_view &sv);

    // Splits on `sep`, trims each part and drops empty parts
    std::vector<std::string> split(const std::string_view &sv, char sep);

    // Splits on "\n", "\r\n" or "\r". A trailing line terminator does not produce an extra empty line.
    std::vector<std::string_view> lines(std::string_view sv);

} // namespace str

#endif
