#include <rsp/Prompt.hpp>

#include <str/util.hpp>
#include <util/log.hpp>

#include <rubr/mss.hpp>

namespace rsp {

    ReturnCode Prompt::run(ResponseFile &rsp, std::string &name)
    {
        MSS_BEGIN(ReturnCode);

        std::string answer;
        bool flag = false;

        MSS(ask_("Enter output file path: ", answer));
        rsp.output = answer;

        MSS(ask_("Enter programming languages (comma-separated, or 'all'): ", answer));
        rsp.language = answer;

        MSS(ask_yes_no_("Include file origin as comments? (yes/no): ", flag));
        rsp.note = flag;

        MSS(ask_("Enter sort order ('name' or 'type'): ", answer));
        rsp.sort = answer;

        MSS(ask_yes_no_("Remove empty lines? (yes/no): ", flag));
        rsp.remove_empty_lines = flag;

        MSS(ask_("Enter response file name (without extension): ", name));

        MSS_END();
    }

    ReturnCode Prompt::ask_(const char *question, std::string &answer)
    {
        MSS_BEGIN(ReturnCode);

        os_ << question << std::flush;
        MSS(!!std::getline(is_, answer), util::log::error() << "Input ended before all questions were answered" << std::endl);
        if (!answer.empty() && answer.back() == '\r')
            answer.pop_back();

        MSS_END();
    }

    ReturnCode Prompt::ask_yes_no_(const char *question, bool &answer)
    {
        MSS_BEGIN(ReturnCode);

        std::string str;
        MSS(ask_(question, str));
        answer = str::iequals(str, "yes");

        MSS_END();
    }

} // namespace rsp
