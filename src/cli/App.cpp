#include <cli/App.hpp>

#include <bundle/Bundler.hpp>
#include <bundle/Collector.hpp>
#include <lang/Language.hpp>
#include <rsp/Prompt.hpp>
#include <rsp/ResponseFile.hpp>
#include <util/log.hpp>

#include <rubr/mss.hpp>
#include <rubr/profile/Stopwatch.hpp>

#include <chrono>
#include <iostream>

namespace cli {

    ReturnCode App::run()
    {
        MSS_BEGIN(ReturnCode);

        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        MSS(!ec, util::log::error() << "Could not determine the working directory: " << ec.message() << std::endl);

        MSS(run(cwd, std::cin, std::cout));

        MSS_END();
    }

    ReturnCode App::run(const std::filesystem::path &cwd, std::istream &is, std::ostream &os)
    {
        MSS_BEGIN(ReturnCode);

        const rubr::profile::Stopwatch sw;

        if (!options_.command)
        {
            os << options_.help();
            MSS_RETURN_OK();
        }

        switch (*options_.command)
        {
            case Command::Bundle:
                MSS(bundle_(cwd, os));
                break;
            case Command::CreateRsp:
                MSS(create_rsp_(cwd, is, os));
                break;
        }

        util::log::verbose() << "Elapse: " << sw.elapse<std::chrono::milliseconds>() << std::endl;

        MSS_END();
    }

    ReturnCode App::bundle_(const std::filesystem::path &cwd, std::ostream &os)
    {
        MSS_BEGIN(ReturnCode);

        MSS(config_.init(options_, cwd));

        bundle::Files files;
        {
            bundle::Collector collector{bundle::Collector::Config{
                .root = config_.root,
                .extensions = lang::extensions(config_.languages),
                .exclude = config_.output,
            }};
            MSS(collector.collect(files));
        }

        if (files.empty())
            return ReturnCode::NoFilesFound;

        const bundle::Bundler bundler{bundle::Bundler::Config{
            .note = config_.note,
            .remove_empty_lines = config_.remove_empty_lines,
            .sort = config_.sort,
        }};
        MSS(bundler.bundle(config_.output, files));

        os << "Bundle created at: " << config_.output.string() << std::endl;

        MSS_END();
    }

    ReturnCode App::create_rsp_(const std::filesystem::path &cwd, std::istream &is, std::ostream &os) const
    {
        MSS_BEGIN(ReturnCode);

        rsp::ResponseFile rsp;
        std::string name;
        rsp::Prompt prompt{is, os};
        MSS(prompt.run(rsp, name));

        const auto fp = cwd / (name + ".rsp");
        MSS(rsp.save(fp));

        os << "Response file created: " << fp.string() << std::endl;

        MSS_END();
    }

} // namespace cli
