#include <cli/Config.hpp>

#include <rsp/ResponseFile.hpp>
#include <str/util.hpp>
#include <util/log.hpp>

#include <rubr/mss.hpp>

#include <algorithm>
#include <system_error>

namespace cli {

    ReturnCode Config::init(const Options &options, const std::filesystem::path &cwd)
    {
        MSS_BEGIN(ReturnCode);

        root = cwd;

        std::optional<std::string> output_str = options.output;
        std::vector<std::string> language_strs = options.languages;
        std::optional<std::string> sort_str = options.sort;
        note = options.note;
        remove_empty_lines = options.remove_empty_lines;

        // Response file values override the CLI for each key they define
        if (options.rsp_file)
        {
            std::filesystem::path fp = *options.rsp_file;
            if (fp.is_relative())
                fp = cwd / fp;

            std::error_code ec;
            if (std::filesystem::is_regular_file(fp, ec))
            {
                rsp::ResponseFile rsp;
                MSS(rsp.load(fp));

                if (rsp.output)
                    output_str = rsp.output;
                if (rsp.language)
                    language_strs = {*rsp.language};
                if (rsp.note)
                    note = *rsp.note;
                if (rsp.sort)
                    sort_str = rsp.sort;
                if (rsp.remove_empty_lines)
                    remove_empty_lines = *rsp.remove_empty_lines;
            }
            else
            {
                util::log::warning() << "Response file " << fp << " does not exist, ignoring it" << std::endl;
            }
        }

        if (!output_str || str::trim(*output_str).empty())
            return ReturnCode::MissingOutput;

        sort = bundle::Sort::Name;
        if (sort_str && !sort_str->empty())
        {
            if (const auto s = bundle::parse_sort(*sort_str); !!s)
                sort = *s;
            else
                util::log::warning() << "Unknown sort order '" << *sort_str << "', sorting by " << sort << std::endl;
        }
        util::log::verbose() << "Sorting by " << sort << std::endl;

        restricted.insert(restricted.end(), options.restricted.begin(), options.restricted.end());
        const auto cwd_str = cwd.string();
        const auto it = std::find_if(restricted.begin(), restricted.end(), [&](const auto &pattern) { return !pattern.empty() && str::icontains(cwd_str, pattern); });
        if (it != restricted.end())
        {
            util::log::verbose() << "Working directory " << cwd << " matches restricted pattern '" << *it << "'" << std::endl;
            return ReturnCode::RestrictedFolder;
        }

        output = (cwd / *output_str).lexically_normal();
        {
            std::error_code ec;
            if (!std::filesystem::is_directory(output.parent_path(), ec))
                return ReturnCode::OutputDirMissing;
        }

        languages.clear();
        for (const auto &list : language_strs)
            for (auto &lang : str::split(list, ','))
                languages.push_back(std::move(lang));

        MSS_END();
    }

} // namespace cli
