#ifndef HEADER_rsp_Prompt_hpp_ALREADY_INCLUDED
#define HEADER_rsp_Prompt_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>
#include <rsp/ResponseFile.hpp>

#include <istream>
#include <ostream>
#include <string>

namespace rsp {

    // Collects a response file through line-oriented questions
    class Prompt
    {
    public:
        Prompt(std::istream &is, std::ostream &os)
            : is_(is), os_(os) {}

        // `name` receives the response file name without extension
        ReturnCode run(ResponseFile &rsp, std::string &name);

    private:
        ReturnCode ask_(const char *question, std::string &answer);
        ReturnCode ask_yes_no_(const char *question, bool &answer);

        std::istream &is_;
        std::ostream &os_;
    };

} // namespace rsp

#endif
