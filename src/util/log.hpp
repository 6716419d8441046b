#ifndef HEADER_util_log_hpp_ALREADY_INCLUDED
#define HEADER_util_log_hpp_ALREADY_INCLUDED

#include <ostream>

namespace util { namespace log {

    // Level at which `--verbose` diagnostics are shown
    constexpr int Verbose = 1;

    // Number of `--verbose` flags
    void set_level(int level);

    std::ostream &os(int level);
    std::ostream &verbose();
    std::ostream &error();
    std::ostream &warning();

}} // namespace util::log

#endif
