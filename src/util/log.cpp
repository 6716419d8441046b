#include <util/log.hpp>

#include <gubg/Logger.hpp>

namespace util { namespace log {

    namespace {
        gubg::Logger &logger()
        {
            static gubg::Logger s_logger;
            return s_logger;
        }
    } // namespace

    void set_level(int level) { logger().level = level; }

    std::ostream &os(int level) { return logger().os(level); }
    std::ostream &verbose() { return os(Verbose); }
    std::ostream &error() { return logger().error(); }
    std::ostream &warning() { return logger().warning(); }

}} // namespace util::log
