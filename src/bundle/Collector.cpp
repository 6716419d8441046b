#include <bundle/Collector.hpp>

#include <str/util.hpp>
#include <util/log.hpp>

#include <rubr/fs/Walker.hpp>
#include <rubr/mss.hpp>

#include <algorithm>
#include <system_error>

namespace bundle {

    ReturnCode Collector::collect(Files &files) const
    {
        MSS_BEGIN(ReturnCode);

        Files found;

        using Walker = rubr::fs::Walker;
        Walker walker{Walker::Config{.basedir = config_.root}};

        MSS(walker([&](const std::filesystem::path &fp) {
            MSS_BEGIN(bool);

            auto abs = fp.is_absolute() ? fp : config_.root / fp;
            abs = abs.lexically_normal();

            if (matches_(abs))
                found.push_back(abs);

            MSS_END();
        }), util::log::error() << "Could not walk " << config_.root << std::endl);

        std::sort(found.begin(), found.end());
        util::log::verbose() << "Collected " << found.size() << " files under " << config_.root << std::endl;

        files.insert(files.end(), found.begin(), found.end());

        MSS_END();
    }

    bool Collector::matches_(const std::filesystem::path &fp) const
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(fp, ec))
            return false;

        if (config_.exclude && fp == config_.exclude->lexically_normal())
            return false;

        const auto ext = str::to_lower(fp.extension().string());
        return std::find(config_.extensions.begin(), config_.extensions.end(), ext) != config_.extensions.end();
    }

} // namespace bundle
