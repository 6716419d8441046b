#include <bundle/Bundler.hpp>

#include <str/util.hpp>
#include <util/log.hpp>

#include <rubr/fs/util.hpp>
#include <rubr/mss.hpp>

#include <algorithm>
#include <fstream>

namespace bundle {

    namespace {
        ReturnCode read(std::string &content, const std::filesystem::path &fp)
        {
            MSS_BEGIN(ReturnCode);
            MSS(rubr::fs::read(content, fp));
            MSS_END();
        }
    } // namespace

    std::ostream &operator<<(std::ostream &os, Sort sort)
    {
        switch (sort)
        {
            case Sort::Name: os << "name"; break;
            case Sort::Type: os << "type"; break;
        }
        return os;
    }

    std::optional<Sort> parse_sort(const std::string_view &name)
    {
        if (name == "name") return Sort::Name;
        if (name == "type") return Sort::Type;
        return std::nullopt;
    }

    void sort(Files &files, Sort sort)
    {
        auto by_name = [](const auto &a, const auto &b) {
            return a.filename().string() < b.filename().string();
        };
        auto by_type = [&](const auto &a, const auto &b) {
            const auto ea = a.extension().string(), eb = b.extension().string();
            if (ea != eb)
                return ea < eb;
            return by_name(a, b);
        };

        switch (sort)
        {
            case Sort::Name: std::stable_sort(files.begin(), files.end(), by_name); break;
            case Sort::Type: std::stable_sort(files.begin(), files.end(), by_type); break;
        }
    }

    ReturnCode Bundler::bundle(const std::filesystem::path &output, Files files) const
    {
        MSS_BEGIN(ReturnCode);

        sort(files, config_.sort);

        std::vector<std::string> contents(files.size());
        for (auto ix = 0u; ix < files.size(); ++ix)
        {
            if (read(contents[ix], files[ix]) != ReturnCode::Ok)
            {
                util::log::error() << "Could not read " << files[ix] << std::endl;
                return ReturnCode::ReadFailed;
            }
        }

        std::ofstream fo{output, std::ios::binary | std::ios::trunc};
        if (!fo.is_open())
        {
            util::log::error() << "Could not open " << output << " for writing" << std::endl;
            return ReturnCode::WriteFailed;
        }

        for (auto ix = 0u; ix < files.size(); ++ix)
            write(fo, files[ix], contents[ix]);

        if (!fo.flush())
        {
            util::log::error() << "Could not write " << output << std::endl;
            return ReturnCode::WriteFailed;
        }

        MSS_END();
    }

    void Bundler::write(std::ostream &os, const std::filesystem::path &fp, const std::string_view &content) const
    {
        if (config_.note)
            os << "// Origin: " << fp.string() << '\n';

        for (const auto line : str::lines(content))
        {
            if (config_.remove_empty_lines && str::is_blank(line))
                continue;
            os << line << '\n';
        }

        os << '\n' << Separator << '\n';
    }

} // namespace bundle
