#include <rsp/ResponseFile.hpp>

#include <str/util.hpp>
#include <util/log.hpp>

#include <rubr/fs/util.hpp>
#include <rubr/mss.hpp>

#include <fstream>
#include <sstream>

namespace rsp {

    namespace {
        bool parse_bool(std::optional<bool> &dst, const std::string_view &value)
        {
            if (str::iequals(value, "true"))
                dst = true;
            else if (str::iequals(value, "false"))
                dst = false;
            else
                return false;
            return true;
        }

        ReturnCode read(std::string &content, const std::filesystem::path &fp)
        {
            MSS_BEGIN(ReturnCode);
            MSS(rubr::fs::read(content, fp));
            MSS_END();
        }
    } // namespace

    ReturnCode ResponseFile::parse(const std::string_view &content)
    {
        MSS_BEGIN(ReturnCode);

        std::string_view text = content;
        if (text.substr(0, 3) == "\xEF\xBB\xBF")
            text.remove_prefix(3);

        std::size_t line_nr = 0;
        for (const auto line : str::lines(text))
        {
            ++line_nr;

            const auto trimmed = str::trim(line);
            if (trimmed.empty())
                continue;

            const auto ix = trimmed.find('=');
            if (ix == std::string_view::npos)
            {
                util::log::error() << "Response file line " << line_nr << " has no '=': '" << trimmed << "'" << std::endl;
                return ReturnCode::MalformedResponseFile;
            }

            const auto key = str::trim(trimmed.substr(0, ix));
            const auto value = str::trim(trimmed.substr(ix + 1));

            bool ok = true;
            if (false) {}
            else if (key == "output")
                output = std::string{value};
            else if (key == "language")
                language = std::string{value};
            else if (key == "note")
                ok = parse_bool(note, value);
            else if (key == "sort")
                sort = std::string{value};
            else if (key == "removeEmptyLines")
                ok = parse_bool(remove_empty_lines, value);
            else
                util::log::warning() << "Ignoring unknown response file key '" << key << "'" << std::endl;

            if (!ok)
            {
                util::log::error() << "Response file line " << line_nr << ": '" << value << "' is not a boolean" << std::endl;
                return ReturnCode::MalformedResponseFile;
            }
        }

        MSS_END();
    }

    std::string ResponseFile::serialize() const
    {
        auto to_str = [](bool b) { return b ? "true" : "false"; };

        std::ostringstream oss;
        if (output)
            oss << "output=" << *output << '\n';
        if (language)
            oss << "language=" << *language << '\n';
        if (note)
            oss << "note=" << to_str(*note) << '\n';
        if (sort)
            oss << "sort=" << *sort << '\n';
        if (remove_empty_lines)
            oss << "removeEmptyLines=" << to_str(*remove_empty_lines) << '\n';
        return oss.str();
    }

    ReturnCode ResponseFile::load(const std::filesystem::path &fp)
    {
        MSS_BEGIN(ReturnCode);

        std::string content;
        if (read(content, fp) != ReturnCode::Ok)
        {
            util::log::error() << "Could not read response file " << fp << std::endl;
            return ReturnCode::ReadFailed;
        }

        MSS(parse(content));

        MSS_END();
    }

    ReturnCode ResponseFile::save(const std::filesystem::path &fp) const
    {
        MSS_BEGIN(ReturnCode);

        std::ofstream fo{fp, std::ios::binary | std::ios::trunc};
        if (!fo.is_open())
        {
            util::log::error() << "Could not open " << fp << " for writing" << std::endl;
            return ReturnCode::WriteFailed;
        }

        fo << serialize();
        if (!fo.flush())
            return ReturnCode::WriteFailed;

        MSS_END();
    }

} // namespace rsp
