#include <str/util.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace str {

    namespace {
        bool is_space(char ch) { return std::isspace(static_cast<unsigned char>(ch)); }
        char lower(char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); }
    } // namespace

    std::string_view trim(const std::string_view &sv)
    {
        std::size_t b = 0, e = sv.size();
        while (b < e && is_space(sv[b]))
            ++b;
        while (e > b && is_space(sv[e - 1]))
            --e;
        return sv.substr(b, e - b);
    }

    std::string to_lower(const std::string_view &sv)
    {
        std::string res{sv};
        std::transform(res.begin(), res.end(), res.begin(), lower);
        return res;
    }

    bool iequals(const std::string_view &a, const std::string_view &b)
    {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return lower(x) == lower(y); });
    }

    bool icontains(const std::string_view &haystack, const std::string_view &needle)
    {
        const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char x, char y) { return lower(x) == lower(y); });
        return it != haystack.end() || needle.empty();
    }

    bool is_blank(const std::string_view &sv)
    {
        static constexpr std::string_view s_unicode_spaces[] = {
            "\xC2\x85", "\xC2\xA0", "\xE1\x9A\x80",
            "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85",
            "\xE2\x80\x86", "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",
            "\xE2\x80\xA8", "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80",
        };

        for (auto rest = sv; !rest.empty();)
        {
            if (is_space(rest[0]))
            {
                rest.remove_prefix(1);
                continue;
            }
            const auto it = std::find_if(std::begin(s_unicode_spaces), std::end(s_unicode_spaces), [&](const auto &space) { return rest.substr(0, space.size()) == space; });
            if (it == std::end(s_unicode_spaces))
                return false;
            rest.remove_prefix(it->size());
        }
        return true;
    }

    std::vector<std::string> split(const std::string_view &sv, char sep)
    {
        std::vector<std::string> parts;
        std::size_t ix = 0;
        while (ix <= sv.size())
        {
            auto end = sv.find(sep, ix);
            if (end == std::string_view::npos)
                end = sv.size();
            if (const auto part = trim(sv.substr(ix, end - ix)); !part.empty())
                parts.emplace_back(part);
            ix = end + 1;
        }
        return parts;
    }

    std::vector<std::string_view> lines(std::string_view sv)
    {
        std::vector<std::string_view> res;
        while (!sv.empty())
        {
            const auto ix = sv.find_first_of("\r\n");
            if (ix == std::string_view::npos)
            {
                res.push_back(sv);
                break;
            }
            res.push_back(sv.substr(0, ix));
            auto skip = ix + 1;
            if (sv[ix] == '\r' && skip < sv.size() && sv[skip] == '\n')
                ++skip;
            sv.remove_prefix(skip);
        }
        return res;
    }

} // namespace str
