#ifndef CHUNKSTREAM_MYLOGGER_HPP
#define CHUNKSTREAM_MYLOGGER_HPP

#include <string>

namespace chunkstream
{

    // Static logging facade used across the service, backed by Boost.Log.
    // Until init() is called, messages go to Boost.Log's default console sink.
    class MyLogger
    {
    public:
        // level: one of "debug", "info", "warning", "error".
        // log_file: optional path of an additional file sink (empty = console only).
        static void init(const std::string &level, const std::string &log_file = "");

        static void debug(const std::string &msg);
        static void info(const std::string &msg);
        static void warning(const std::string &msg);
        static void error(const std::string &msg);
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_MYLOGGER_HPP
